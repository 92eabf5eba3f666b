// kicad_format/model/symbol.hpp - Library symbol entities
//
// Root and derived symbol definitions, their properties, pins and sub-units.
// Fields with more than one legal spelling keep a provenance flag so that
// to_sexpr() reproduces the spelling that was read.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "kicad_format/basic/string_interner.hpp"
#include "kicad_format/model/common.hpp"
#include "kicad_format/model/graphics.hpp"
#include "kicad_format/model/library_id.hpp"

namespace kicad_format
{

// ============================================================================
// Properties
// ============================================================================

/**
 * `(property "key" "value" (id N)? (at x y a?) (show_name)? (do_not_autoplace)? effects)`
 *
 * The key is interned. The legacy `(id N)` node is carried through verbatim
 * and never interpreted.
 */
struct SymbolProperty
{
  static constexpr std::string_view k_keyword = "property";

  InternedString key;
  std::string value;
  std::optional<double> legacy_id;
  Position position;
  bool show_name = false;
  bool do_not_autoplace = false;
  TextEffects effects;

  static SymbolProperty from_sexpr(Parser parser);
  static SymbolProperty from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const SymbolProperty & o) const
  {
    return key == o.key && value == o.value && legacy_id == o.legacy_id &&
           position == o.position && show_name == o.show_name &&
           do_not_autoplace == o.do_not_autoplace && effects == o.effects;
  }
  bool operator!=(const SymbolProperty & o) const { return !(*this == o); }
};

// ============================================================================
// Pin display options
// ============================================================================

/// `(pin_names (offset n)? [hide | (hide b)])`
struct PinNames
{
  static constexpr std::string_view k_keyword = "pin_names";

  std::optional<double> offset;
  KeywordFlag hide;

  static PinNames from_sexpr(Parser parser);
  static PinNames from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const PinNames & o) const { return offset == o.offset && hide == o.hide; }
  bool operator!=(const PinNames & o) const { return !(*this == o); }
};

/// `(pin_numbers hide)` (legacy) or `(pin_numbers (hide b))`
struct PinNumbers
{
  static constexpr std::string_view k_keyword = "pin_numbers";

  KeywordFlag hide;

  /// Written as a bare `hide` keyword.
  [[nodiscard]] bool hide_legacy_format() const noexcept
  {
    return hide.spelling == KeywordFlag::Spelling::Bare;
  }

  static PinNumbers from_sexpr(Parser parser);
  static PinNumbers from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const PinNumbers & o) const { return hide == o.hide; }
  bool operator!=(const PinNumbers & o) const { return !(*this == o); }
};

// ============================================================================
// Pins
// ============================================================================

enum class ElectricalType : uint8_t {
  Input,
  Output,
  Bidirectional,
  TriState,
  Passive,
  Free,
  Unspecified,
  PowerIn,
  PowerOut,
  OpenCollector,
  OpenEmitter,
  NoConnect,
};

template <>
struct EnumTraits<ElectricalType>
{
  static constexpr std::string_view name = "pin electrical type";
  static std::optional<ElectricalType> from_symbol(std::string_view s);
  static std::string_view to_symbol(ElectricalType v);
};

enum class PinGraphicStyle : uint8_t {
  Line,
  Inverted,
  Clock,
  InvertedClock,
  InputLow,
  ClockLow,
  OutputLow,
  EdgeClockHigh,
  NonLogic,
};

template <>
struct EnumTraits<PinGraphicStyle>
{
  static constexpr std::string_view name = "pin graphic style";
  static std::optional<PinGraphicStyle> from_symbol(std::string_view s);
  static std::string_view to_symbol(PinGraphicStyle v);
};

/// `(alternate "name" <electrical> <graphic_style>)`
struct PinAlternate
{
  static constexpr std::string_view k_keyword = "alternate";

  std::string name;
  ElectricalType electrical_type = ElectricalType::Unspecified;
  PinGraphicStyle graphic_style = PinGraphicStyle::Line;

  static PinAlternate from_sexpr(Parser parser);
  static PinAlternate from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const PinAlternate & o) const
  {
    return name == o.name && electrical_type == o.electrical_type &&
           graphic_style == o.graphic_style;
  }
};

/**
 * `(pin <electrical> <style> (at x y a) (length l) [hide | (hide b)]
 *    (name "n" effects) (number "n" effects) alternate*)`
 */
struct Pin
{
  static constexpr std::string_view k_keyword = "pin";

  ElectricalType electrical_type = ElectricalType::Unspecified;
  PinGraphicStyle graphic_style = PinGraphicStyle::Line;
  Position position;
  double length = 0.0;
  KeywordFlag hide;
  std::string name;
  TextEffects name_effects;
  std::string number;
  TextEffects number_effects;
  std::vector<PinAlternate> alternates;

  static Pin from_sexpr(Parser parser);
  static Pin from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Pin & o) const
  {
    return electrical_type == o.electrical_type && graphic_style == o.graphic_style &&
           position == o.position && length == o.length && hide == o.hide && name == o.name &&
           name_effects == o.name_effects && number == o.number &&
           number_effects == o.number_effects && alternates == o.alternates;
  }
  bool operator!=(const Pin & o) const { return !(*this == o); }
};

// ============================================================================
// Symbols
// ============================================================================

/// `(symbol "<name>_<unit>_<style>" (unit_name "n")? graphic* pin*)`
struct LibSymbolSubUnit
{
  static constexpr std::string_view k_keyword = "symbol";

  UnitId id;
  std::optional<std::string> unit_name;
  std::vector<GraphicItem> graphics;
  std::vector<Pin> pins;

  static LibSymbolSubUnit from_sexpr(Parser parser);
  static LibSymbolSubUnit from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const LibSymbolSubUnit & o) const
  {
    return id == o.id && unit_name == o.unit_name && graphics == o.graphics && pins == o.pins;
  }
  bool operator!=(const LibSymbolSubUnit & o) const { return !(*this == o); }
};

/**
 * A root symbol with its full field set:
 *
 *   (symbol "<lib:name>" (power)? pin_numbers? pin_names? (exclude_from_sim b)?
 *     (in_bom b) (on_board b) property* graphic* pin* unit* (embedded_fonts b)?)
 */
struct LibSymbol
{
  static constexpr std::string_view k_keyword = "symbol";

  /// Word pair each boolean field was written with.
  struct BoolSpellings
  {
    BoolSpelling exclude_from_sim = BoolSpelling::YesNo;
    BoolSpelling in_bom = BoolSpelling::YesNo;
    BoolSpelling on_board = BoolSpelling::YesNo;
    BoolSpelling embedded_fonts = BoolSpelling::YesNo;

    bool operator==(const BoolSpellings & o) const
    {
      return exclude_from_sim == o.exclude_from_sim && in_bom == o.in_bom &&
             on_board == o.on_board && embedded_fonts == o.embedded_fonts;
    }
    bool operator!=(const BoolSpellings & o) const { return !(*this == o); }
  };

  LibraryId id;
  bool power = false;
  std::optional<PinNumbers> pin_numbers;
  std::optional<PinNames> pin_names;
  std::optional<bool> exclude_from_sim;
  bool in_bom = false;
  bool on_board = false;
  std::vector<SymbolProperty> properties;
  std::vector<GraphicItem> graphics;
  std::vector<Pin> pins;
  std::vector<LibSymbolSubUnit> units;
  std::optional<bool> embedded_fonts;
  BoolSpellings spellings;

  static LibSymbol from_sexpr(Parser parser);
  static LibSymbol from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const LibSymbol & o) const
  {
    return id == o.id && power == o.power && pin_numbers == o.pin_numbers &&
           pin_names == o.pin_names && exclude_from_sim == o.exclude_from_sim &&
           in_bom == o.in_bom && on_board == o.on_board && properties == o.properties &&
           graphics == o.graphics && pins == o.pins && units == o.units &&
           embedded_fonts == o.embedded_fonts && spellings == o.spellings;
  }
  bool operator!=(const LibSymbol & o) const { return !(*this == o); }
};

/**
 * `(symbol "<lib:name>" (extends "<name>") property*)`
 *
 * `extends` names the root symbol in the same library. It is kept as a plain
 * name and resolved by whoever consumes the library.
 */
struct DerivedLibSymbol
{
  static constexpr std::string_view k_keyword = "symbol";

  LibraryId id;
  std::string extends;
  std::vector<SymbolProperty> properties;

  static DerivedLibSymbol from_sexpr(Parser parser);
  static DerivedLibSymbol from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const DerivedLibSymbol & o) const
  {
    return id == o.id && extends == o.extends && properties == o.properties;
  }
  bool operator!=(const DerivedLibSymbol & o) const { return !(*this == o); }
};

/**
 * A root or derived symbol.
 *
 * Both share the `symbol` keyword and the id; a derived symbol has an
 * `(extends ...)` list right after the id. The owning parse resolves this by
 * snapshot and backtrack, the borrowing parse by inspecting the third child
 * of the list node.
 */
struct SymbolDefinition
{
  static constexpr std::string_view k_keyword = "symbol";

  std::variant<LibSymbol, DerivedLibSymbol> value;

  [[nodiscard]] bool is_root() const noexcept { return value.index() == 0; }
  [[nodiscard]] bool is_derived() const noexcept { return value.index() == 1; }
  [[nodiscard]] const LibSymbol * as_root() const noexcept { return std::get_if<0>(&value); }
  [[nodiscard]] const DerivedLibSymbol * as_derived() const noexcept
  {
    return std::get_if<1>(&value);
  }
  [[nodiscard]] const LibraryId & id() const noexcept;

  static SymbolDefinition from_sexpr(Parser parser);
  static SymbolDefinition from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const SymbolDefinition & o) const { return value == o.value; }
  bool operator!=(const SymbolDefinition & o) const { return !(*this == o); }
};

/// Structural peek: true when `children[2]` is an `(extends ...)` list.
[[nodiscard]] bool is_derived_symbol_node(gsl::span<const SexprNode * const> children) noexcept;

}  // namespace kicad_format
