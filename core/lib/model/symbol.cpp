// kicad_format/model/symbol.cpp - Symbol, property and pin grammar
#include "kicad_format/model/symbol.hpp"

#include <tuple>
#include <utility>

namespace kicad_format
{
namespace
{

constexpr EnumTable<ElectricalType, 12> k_electrical_types = {{
  {"input", ElectricalType::Input},
  {"output", ElectricalType::Output},
  {"bidirectional", ElectricalType::Bidirectional},
  {"tri_state", ElectricalType::TriState},
  {"passive", ElectricalType::Passive},
  {"free", ElectricalType::Free},
  {"unspecified", ElectricalType::Unspecified},
  {"power_in", ElectricalType::PowerIn},
  {"power_out", ElectricalType::PowerOut},
  {"open_collector", ElectricalType::OpenCollector},
  {"open_emitter", ElectricalType::OpenEmitter},
  {"no_connect", ElectricalType::NoConnect},
}};

constexpr EnumTable<PinGraphicStyle, 9> k_pin_graphic_styles = {{
  {"line", PinGraphicStyle::Line},
  {"inverted", PinGraphicStyle::Inverted},
  {"clock", PinGraphicStyle::Clock},
  {"inverted_clock", PinGraphicStyle::InvertedClock},
  {"input_low", PinGraphicStyle::InputLow},
  {"clock_low", PinGraphicStyle::ClockLow},
  {"output_low", PinGraphicStyle::OutputLow},
  {"edge_clock_high", PinGraphicStyle::EdgeClockHigh},
  {"non_logic", PinGraphicStyle::NonLogic},
}};

template <typename T>
void append_all(SexprList & out, const std::vector<T> & items)
{
  for (const auto & item : items) {
    out.push_back(item.to_sexpr());
  }
}

// ============================================================================
// Grammar
// ============================================================================

template <typename P>
SymbolProperty parse_property(P & p)
{
  p.expect_symbol_matching(SymbolProperty::k_keyword);
  SymbolProperty prop;
  prop.key = intern_property_key(p.expect_string());
  prop.value = std::string(p.expect_string());
  if (auto id = p.maybe_list_with_name("id")) {
    prop.legacy_id = id->expect_number();
    id->expect_end();
  }
  prop.position = p.template expect<Position>();
  prop.show_name = p.maybe_empty_list_with_name("show_name");
  prop.do_not_autoplace = p.maybe_empty_list_with_name("do_not_autoplace");
  prop.effects = p.template expect<TextEffects>();
  p.expect_end();
  return prop;
}

template <typename P>
PinNames parse_pin_names(P & p)
{
  p.expect_symbol_matching(PinNames::k_keyword);
  PinNames names;
  names.offset = p.maybe_number_with_name("offset");
  names.hide = p.maybe_keyword_flag("hide");
  p.expect_end();
  return names;
}

template <typename P>
PinNumbers parse_pin_numbers(P & p)
{
  p.expect_symbol_matching(PinNumbers::k_keyword);
  PinNumbers numbers;
  numbers.hide = p.maybe_keyword_flag("hide");
  p.expect_end();
  return numbers;
}

template <typename P>
PinAlternate parse_alternate(P & p)
{
  p.expect_symbol_matching(PinAlternate::k_keyword);
  PinAlternate alt;
  alt.name = std::string(p.expect_string());
  alt.electrical_type = p.template expect_enum<ElectricalType>();
  alt.graphic_style = p.template expect_enum<PinGraphicStyle>();
  p.expect_end();
  return alt;
}

/// `(name "n" effects)` or `(number "n" effects)`
template <typename P>
std::pair<std::string, TextEffects> parse_pin_label(P & p, std::string_view keyword)
{
  auto label = p.expect_list_with_name(keyword);
  std::string text(label.expect_string());
  TextEffects effects = label.template expect<TextEffects>();
  label.expect_end();
  return {std::move(text), std::move(effects)};
}

Sexpr pin_label_to_sexpr(
  std::string_view keyword, const std::string & text, const TextEffects & effects)
{
  return Sexpr::list_with_name(keyword, {Sexpr::string(text), effects.to_sexpr()});
}

template <typename P>
Pin parse_pin(P & p)
{
  p.expect_symbol_matching(Pin::k_keyword);
  Pin pin;
  pin.electrical_type = p.template expect_enum<ElectricalType>();
  pin.graphic_style = p.template expect_enum<PinGraphicStyle>();
  pin.position = p.template expect<Position>();
  pin.length = p.expect_number_with_name("length");
  pin.hide = p.maybe_keyword_flag("hide");
  std::tie(pin.name, pin.name_effects) = parse_pin_label(p, "name");
  std::tie(pin.number, pin.number_effects) = parse_pin_label(p, "number");
  pin.alternates = p.template expect_many<PinAlternate>();
  p.expect_end();
  return pin;
}

template <typename P>
LibSymbolSubUnit parse_sub_unit(P & p)
{
  p.expect_symbol_matching(LibSymbolSubUnit::k_keyword);
  LibSymbolSubUnit unit;
  unit.id = UnitId::parse(p.expect_string());
  if (auto name = p.maybe_string_with_name("unit_name")) {
    unit.unit_name = std::string(*name);
  }
  unit.graphics = p.template expect_many<GraphicItem>();
  unit.pins = p.template expect_many<Pin>();
  p.expect_end();
  return unit;
}

template <typename P>
LibSymbol parse_lib_symbol(P & p)
{
  p.expect_symbol_matching(LibSymbol::k_keyword);
  LibSymbol sym;
  sym.id = LibraryId::parse(p.expect_string());
  sym.power = p.maybe_empty_list_with_name("power");
  sym.pin_numbers = p.template maybe<PinNumbers>();
  sym.pin_names = p.template maybe<PinNames>();
  sym.exclude_from_sim =
    p.maybe_bool_with_name("exclude_from_sim", &sym.spellings.exclude_from_sim);
  sym.in_bom = p.expect_bool_with_name("in_bom", &sym.spellings.in_bom);
  sym.on_board = p.expect_bool_with_name("on_board", &sym.spellings.on_board);
  sym.properties = p.template expect_many<SymbolProperty>();
  sym.graphics = p.template expect_many<GraphicItem>();
  sym.pins = p.template expect_many<Pin>();
  sym.units = p.template expect_many<LibSymbolSubUnit>();
  sym.embedded_fonts = p.maybe_bool_with_name("embedded_fonts", &sym.spellings.embedded_fonts);
  p.expect_end();
  return sym;
}

/// Remainder of a derived symbol after `(extends "...")` has been opened.
template <typename P, typename ExtendsCursor>
DerivedLibSymbol finish_derived(P & p, LibraryId id, ExtendsCursor & extends)
{
  DerivedLibSymbol sym;
  sym.id = std::move(id);
  sym.extends = std::string(extends.expect_string());
  extends.expect_end();
  sym.properties = p.template expect_many<SymbolProperty>();
  p.expect_end();
  return sym;
}

template <typename P>
DerivedLibSymbol parse_derived_symbol(P & p)
{
  p.expect_symbol_matching(DerivedLibSymbol::k_keyword);
  LibraryId id = LibraryId::parse(p.expect_string());
  auto extends = p.expect_list_with_name("extends");
  return finish_derived(p, std::move(id), extends);
}

}  // namespace

// ============================================================================
// Enumerations
// ============================================================================

std::optional<ElectricalType> EnumTraits<ElectricalType>::from_symbol(std::string_view s)
{
  return lookup_enum(k_electrical_types, s);
}

std::string_view EnumTraits<ElectricalType>::to_symbol(ElectricalType v)
{
  return lookup_enum_symbol(k_electrical_types, v);
}

std::optional<PinGraphicStyle> EnumTraits<PinGraphicStyle>::from_symbol(std::string_view s)
{
  return lookup_enum(k_pin_graphic_styles, s);
}

std::string_view EnumTraits<PinGraphicStyle>::to_symbol(PinGraphicStyle v)
{
  return lookup_enum_symbol(k_pin_graphic_styles, v);
}

// ============================================================================
// SymbolProperty
// ============================================================================

SymbolProperty SymbolProperty::from_sexpr(Parser parser) { return parse_property(parser); }
SymbolProperty SymbolProperty::from_sexpr_ref(ParserRef parser) { return parse_property(parser); }

Sexpr SymbolProperty::to_sexpr() const
{
  SexprList items{Sexpr::string(std::string(key.str())), Sexpr::string(value)};
  if (legacy_id) {
    items.push_back(Sexpr::number_with_name("id", *legacy_id));
  }
  items.push_back(position.to_sexpr());
  if (show_name) {
    items.push_back(Sexpr::list_with_name("show_name"));
  }
  if (do_not_autoplace) {
    items.push_back(Sexpr::list_with_name("do_not_autoplace"));
  }
  items.push_back(effects.to_sexpr());
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

// ============================================================================
// PinNames / PinNumbers
// ============================================================================

PinNames PinNames::from_sexpr(Parser parser) { return parse_pin_names(parser); }
PinNames PinNames::from_sexpr_ref(ParserRef parser) { return parse_pin_names(parser); }

Sexpr PinNames::to_sexpr() const
{
  SexprList items;
  if (offset) {
    items.push_back(Sexpr::number_with_name("offset", *offset));
  }
  hide.append_to(items, "hide");
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

PinNumbers PinNumbers::from_sexpr(Parser parser) { return parse_pin_numbers(parser); }
PinNumbers PinNumbers::from_sexpr_ref(ParserRef parser) { return parse_pin_numbers(parser); }

Sexpr PinNumbers::to_sexpr() const
{
  SexprList items;
  hide.append_to(items, "hide");
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

// ============================================================================
// Pins
// ============================================================================

PinAlternate PinAlternate::from_sexpr(Parser parser) { return parse_alternate(parser); }
PinAlternate PinAlternate::from_sexpr_ref(ParserRef parser) { return parse_alternate(parser); }

Sexpr PinAlternate::to_sexpr() const
{
  return Sexpr::list_with_name(
    k_keyword, {Sexpr::string(name),
                Sexpr::symbol(std::string(EnumTraits<ElectricalType>::to_symbol(electrical_type))),
                Sexpr::symbol(std::string(EnumTraits<PinGraphicStyle>::to_symbol(graphic_style)))});
}

Pin Pin::from_sexpr(Parser parser) { return parse_pin(parser); }
Pin Pin::from_sexpr_ref(ParserRef parser) { return parse_pin(parser); }

Sexpr Pin::to_sexpr() const
{
  SexprList items{
    Sexpr::symbol(std::string(EnumTraits<ElectricalType>::to_symbol(electrical_type))),
    Sexpr::symbol(std::string(EnumTraits<PinGraphicStyle>::to_symbol(graphic_style))),
    position.to_sexpr(),
    Sexpr::number_with_name("length", length),
  };
  hide.append_to(items, "hide");
  items.push_back(pin_label_to_sexpr("name", name, name_effects));
  items.push_back(pin_label_to_sexpr("number", number, number_effects));
  append_all(items, alternates);
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

// ============================================================================
// LibSymbolSubUnit
// ============================================================================

LibSymbolSubUnit LibSymbolSubUnit::from_sexpr(Parser parser) { return parse_sub_unit(parser); }
LibSymbolSubUnit LibSymbolSubUnit::from_sexpr_ref(ParserRef parser)
{
  return parse_sub_unit(parser);
}

Sexpr LibSymbolSubUnit::to_sexpr() const
{
  SexprList items{id.to_sexpr()};
  if (unit_name) {
    items.push_back(Sexpr::string_with_name("unit_name", *unit_name));
  }
  append_all(items, graphics);
  append_all(items, pins);
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

// ============================================================================
// LibSymbol / DerivedLibSymbol
// ============================================================================

LibSymbol LibSymbol::from_sexpr(Parser parser) { return parse_lib_symbol(parser); }
LibSymbol LibSymbol::from_sexpr_ref(ParserRef parser) { return parse_lib_symbol(parser); }

Sexpr LibSymbol::to_sexpr() const
{
  SexprList items{id.to_sexpr()};
  if (power) {
    items.push_back(Sexpr::list_with_name("power"));
  }
  if (pin_numbers) {
    items.push_back(pin_numbers->to_sexpr());
  }
  if (pin_names) {
    items.push_back(pin_names->to_sexpr());
  }
  if (exclude_from_sim) {
    items.push_back(
      Sexpr::bool_with_name("exclude_from_sim", *exclude_from_sim, spellings.exclude_from_sim));
  }
  items.push_back(Sexpr::bool_with_name("in_bom", in_bom, spellings.in_bom));
  items.push_back(Sexpr::bool_with_name("on_board", on_board, spellings.on_board));
  append_all(items, properties);
  append_all(items, graphics);
  append_all(items, pins);
  append_all(items, units);
  if (embedded_fonts) {
    items.push_back(
      Sexpr::bool_with_name("embedded_fonts", *embedded_fonts, spellings.embedded_fonts));
  }
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

DerivedLibSymbol DerivedLibSymbol::from_sexpr(Parser parser)
{
  return parse_derived_symbol(parser);
}

DerivedLibSymbol DerivedLibSymbol::from_sexpr_ref(ParserRef parser)
{
  return parse_derived_symbol(parser);
}

Sexpr DerivedLibSymbol::to_sexpr() const
{
  SexprList items{id.to_sexpr(), Sexpr::string_with_name("extends", extends)};
  append_all(items, properties);
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

// ============================================================================
// SymbolDefinition
// ============================================================================

const LibraryId & SymbolDefinition::id() const noexcept
{
  return std::visit([](const auto & s) -> const LibraryId & { return s.id; }, value);
}

SymbolDefinition SymbolDefinition::from_sexpr(Parser parser)
{
  // Speculatively read the shared prefix. Copying the cursor is O(1), so the
  // snapshot costs nothing when the symbol turns out to be derived.
  Parser snapshot = parser;

  parser.expect_symbol_matching(k_keyword);
  const std::string id = parser.expect_string();
  if (auto extends = parser.maybe_list_with_name("extends")) {
    return SymbolDefinition{finish_derived(parser, LibraryId::parse(id), *extends)};
  }

  return SymbolDefinition{LibSymbol::from_sexpr(std::move(snapshot))};
}

SymbolDefinition SymbolDefinition::from_sexpr_ref(ParserRef parser)
{
  if (is_derived_symbol_node(parser.nodes())) {
    return SymbolDefinition{DerivedLibSymbol::from_sexpr_ref(parser)};
  }
  return SymbolDefinition{LibSymbol::from_sexpr_ref(parser)};
}

Sexpr SymbolDefinition::to_sexpr() const
{
  return std::visit([](const auto & s) { return s.to_sexpr(); }, value);
}

bool is_derived_symbol_node(gsl::span<const SexprNode * const> children) noexcept
{
  if (children.size() < 3) {
    return false;
  }
  const auto * list = dyn_cast<ListNode>(children[2]);
  return list != nullptr && list->has_name("extends");
}

}  // namespace kicad_format
