// kicad_format/model/json_export.cpp - JSON serialization implementation
//
#include "kicad_format/model/json_export.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>

namespace kicad_format
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

template <typename T, typename F>
void put_optional(json & j, const char * key, const std::optional<T> & value, F && convert)
{
  if (value) {
    j[key] = convert(*value);
  }
}

template <typename T>
void put_optional(json & j, const char * key, const std::optional<T> & value)
{
  if (value) {
    j[key] = *value;
  }
}

json j_flag(const KeywordFlag & flag)
{
  json j{{"value", flag.value}, {"spelling", std::string(to_string(flag.spelling))}};
  if (flag.spelling == KeywordFlag::Spelling::Named) {
    j["words"] = std::string(to_string(flag.words));
  }
  return j;
}

json j_point(const Point & p) { return json{{"x", p.x}, {"y", p.y}}; }

json j_points(const std::vector<Point> & points)
{
  json arr = json::array();
  for (const auto & p : points) {
    arr.push_back(j_point(p));
  }
  return arr;
}

json j_position(const Position & p)
{
  json j{{"x", p.x}, {"y", p.y}};
  put_optional(j, "angle", p.angle);
  return j;
}

json j_color(const Color & c) { return json{{"r", c.r}, {"g", c.g}, {"b", c.b}, {"a", c.a}}; }

json j_stroke(const Stroke & s)
{
  json j{{"width", s.width}, {"type", std::string(EnumTraits<StrokeType>::to_symbol(s.type))}};
  put_optional(j, "color", s.color, j_color);
  return j;
}

json j_fill(const Fill & f)
{
  json j{{"type", std::string(EnumTraits<FillType>::to_symbol(f.type))}};
  put_optional(j, "color", f.color, j_color);
  return j;
}

json j_font(const Font & f)
{
  json j{
    {"size", json{{"height", f.size_height}, {"width", f.size_width}}},
    {"bold", j_flag(f.bold)},
    {"italic", j_flag(f.italic)}};
  put_optional(j, "face", f.face);
  put_optional(j, "thickness", f.thickness);
  put_optional(j, "line_spacing", f.line_spacing);
  put_optional(j, "color", f.color, j_color);
  return j;
}

json j_justify(const Justify & justify)
{
  json j{{"mirror", justify.mirror}};
  put_optional(j, "horizontal", justify.horizontal, [](JustifyHorizontal h) {
    return std::string(to_string(h));
  });
  put_optional(j, "vertical", justify.vertical, [](JustifyVertical v) {
    return std::string(to_string(v));
  });
  return j;
}

json j_effects(const TextEffects & e)
{
  json j{{"font", j_font(e.font)}, {"hide", j_flag(e.hide)}};
  put_optional(j, "justify", e.justify, j_justify);
  return j;
}

json j_property(const SymbolProperty & p)
{
  json j{
    {"key", std::string(p.key.str())},
    {"value", p.value},
    {"position", j_position(p.position)},
    {"show_name", p.show_name},
    {"do_not_autoplace", p.do_not_autoplace},
    {"effects", j_effects(p.effects)}};
  put_optional(j, "legacy_id", p.legacy_id);
  return j;
}

json j_properties(const std::vector<SymbolProperty> & props)
{
  json arr = json::array();
  for (const auto & p : props) {
    arr.push_back(j_property(p));
  }
  return arr;
}

// ============================================================================
// Graphics and pins
// ============================================================================

json j_graphic(const GraphicItem & g)
{
  json j = std::visit(
    [](const auto & item) -> json {
      using T = std::decay_t<decltype(item)>;
      if constexpr (std::is_same_v<T, Arc>) {
        return json{
          {"start", j_point(item.start)}, {"mid", j_point(item.mid)}, {"end", j_point(item.end)},
          {"stroke", j_stroke(item.stroke)}, {"fill", j_fill(item.fill)}};
      } else if constexpr (std::is_same_v<T, Circle>) {
        return json{
          {"center", j_point(item.center)}, {"radius", item.radius},
          {"stroke", j_stroke(item.stroke)}, {"fill", j_fill(item.fill)}};
      } else if constexpr (std::is_same_v<T, Bezier> || std::is_same_v<T, Polyline>) {
        return json{
          {"points", j_points(item.points)}, {"stroke", j_stroke(item.stroke)},
          {"fill", j_fill(item.fill)}};
      } else if constexpr (std::is_same_v<T, Rectangle>) {
        return json{
          {"start", j_point(item.start)}, {"end", j_point(item.end)},
          {"stroke", j_stroke(item.stroke)}, {"fill", j_fill(item.fill)}};
      } else {
        return json{
          {"text", item.text}, {"position", j_position(item.position)},
          {"effects", j_effects(item.effects)}};
      }
    },
    g.item);
  j["type"] = std::string(g.keyword());
  return j;
}

json j_graphics(const std::vector<GraphicItem> & items)
{
  json arr = json::array();
  for (const auto & g : items) {
    arr.push_back(j_graphic(g));
  }
  return arr;
}

json j_pin(const Pin & pin)
{
  json alternates = json::array();
  for (const auto & alt : pin.alternates) {
    alternates.push_back(json{
      {"name", alt.name},
      {"electrical_type", std::string(EnumTraits<ElectricalType>::to_symbol(alt.electrical_type))},
      {"graphic_style", std::string(EnumTraits<PinGraphicStyle>::to_symbol(alt.graphic_style))}});
  }
  return json{
    {"electrical_type", std::string(EnumTraits<ElectricalType>::to_symbol(pin.electrical_type))},
    {"graphic_style", std::string(EnumTraits<PinGraphicStyle>::to_symbol(pin.graphic_style))},
    {"position", j_position(pin.position)},
    {"length", pin.length},
    {"hide", j_flag(pin.hide)},
    {"name", json{{"text", pin.name}, {"effects", j_effects(pin.name_effects)}}},
    {"number", json{{"text", pin.number}, {"effects", j_effects(pin.number_effects)}}},
    {"alternates", alternates}};
}

json j_pins(const std::vector<Pin> & pins)
{
  json arr = json::array();
  for (const auto & p : pins) {
    arr.push_back(j_pin(p));
  }
  return arr;
}

// ============================================================================
// Symbols
// ============================================================================

json j_unit(const LibSymbolSubUnit & unit)
{
  json j{
    {"id", unit.id.to_string()},
    {"unit", unit.id.unit()},
    {"style", unit.id.style()},
    {"graphics", j_graphics(unit.graphics)},
    {"pins", j_pins(unit.pins)}};
  put_optional(j, "unit_name", unit.unit_name);
  return j;
}

json j_library_id(const LibraryId & id)
{
  json j{{"name", id.name()}};
  put_optional(j, "library", id.library());
  return j;
}

json j_root(const LibSymbol & sym)
{
  json units = json::array();
  for (const auto & u : sym.units) {
    units.push_back(j_unit(u));
  }
  json j{
    {"type", "root_symbol"},
    {"id", sym.id.to_string()},
    {"library_id", j_library_id(sym.id)},
    {"power", sym.power},
    {"in_bom", sym.in_bom},
    {"on_board", sym.on_board},
    {"properties", j_properties(sym.properties)},
    {"graphics", j_graphics(sym.graphics)},
    {"pins", j_pins(sym.pins)},
    {"units", units}};
  put_optional(j, "pin_numbers", sym.pin_numbers, [](const PinNumbers & n) {
    return json{{"hide", j_flag(n.hide)}, {"hide_legacy_format", n.hide_legacy_format()}};
  });
  put_optional(j, "pin_names", sym.pin_names, [](const PinNames & n) {
    json pn{{"hide", j_flag(n.hide)}};
    put_optional(pn, "offset", n.offset);
    return pn;
  });
  j["bool_spellings"] = json{
    {"exclude_from_sim", std::string(to_string(sym.spellings.exclude_from_sim))},
    {"in_bom", std::string(to_string(sym.spellings.in_bom))},
    {"on_board", std::string(to_string(sym.spellings.on_board))},
    {"embedded_fonts", std::string(to_string(sym.spellings.embedded_fonts))}};
  put_optional(j, "exclude_from_sim", sym.exclude_from_sim);
  put_optional(j, "embedded_fonts", sym.embedded_fonts);
  return j;
}

json j_derived(const DerivedLibSymbol & sym)
{
  return json{
    {"type", "derived_symbol"},
    {"id", sym.id.to_string()},
    {"library_id", j_library_id(sym.id)},
    {"extends", sym.extends},
    {"properties", j_properties(sym.properties)}};
}

}  // namespace

json to_json(const SymbolDefinition & symbol)
{
  if (const auto * root = symbol.as_root()) {
    return j_root(*root);
  }
  return j_derived(*symbol.as_derived());
}

json to_json(const SymbolLibraryFile & lib)
{
  json symbols = json::array();
  for (const auto & s : lib.symbols) {
    symbols.push_back(to_json(s));
  }
  json j{
    {"version", lib.version},
    {"generator", lib.generator},
    {"generator_is_string", lib.generator_is_string},
    {"symbols", symbols}};
  put_optional(j, "generator_version", lib.generator_version);
  return j;
}

json to_json(const Sexpr & tree)
{
  if (const auto * s = tree.as_symbol()) {
    return json{{"symbol", *s}};
  }
  if (const auto * s = tree.as_string()) {
    return *s;
  }
  if (const auto * n = tree.as_number()) {
    return *n;
  }
  json arr = json::array();
  for (const auto & child : *tree.as_list()) {
    arr.push_back(to_json(child));
  }
  return arr;
}

}  // namespace kicad_format
