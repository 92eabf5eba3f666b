// kicad_format/model/common.hpp - Leaf entities shared by KiCad file formats
//
// Every entity exposes the same static capabilities:
//
//   static T from_sexpr(Parser)             owning parse
//   static T from_sexpr_ref(ParserRef)      borrowing parse
//   static bool is_present(const SexprList &)
//   static bool is_present_ref(const ListNode &)
//   Sexpr to_sexpr() const                  round-trip serialization
//
// Cursors passed to from_sexpr* start at the entity keyword.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "kicad_format/convert/keyword_flag.hpp"
#include "kicad_format/convert/parser.hpp"
#include "kicad_format/convert/parser_ref.hpp"
#include "kicad_format/sexpr/sexpr.hpp"
#include "kicad_format/sexpr/sexpr_node.hpp"

namespace kicad_format
{

// ============================================================================
// Geometry
// ============================================================================

/// A bare coordinate pair such as `(start x y)` or `(xy x y)`.
struct Point
{
  double x = 0.0;
  double y = 0.0;

  [[nodiscard]] Sexpr to_sexpr(std::string_view keyword) const;

  bool operator==(const Point & o) const { return x == o.x && y == o.y; }
  bool operator!=(const Point & o) const { return !(*this == o); }
};

namespace detail
{

/// Parse `(keyword x y)` from the next token of `parent`.
template <typename P>
Point parse_point(P & parent, std::string_view keyword)
{
  auto child = parent.expect_list_with_name(keyword);
  Point pt;
  pt.x = child.expect_number();
  pt.y = child.expect_number();
  child.expect_end();
  return pt;
}

}  // namespace detail

/// `(at x y angle?)`
struct Position
{
  static constexpr std::string_view k_keyword = "at";

  double x = 0.0;
  double y = 0.0;
  std::optional<double> angle;

  static Position from_sexpr(Parser parser);
  static Position from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Position & o) const { return x == o.x && y == o.y && angle == o.angle; }
  bool operator!=(const Position & o) const { return !(*this == o); }
};

/// `(color r g b a)`
struct Color
{
  static constexpr std::string_view k_keyword = "color";

  double r = 0.0;
  double g = 0.0;
  double b = 0.0;
  double a = 0.0;

  static Color from_sexpr(Parser parser);
  static Color from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Color & o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
  bool operator!=(const Color & o) const { return !(*this == o); }
};

// ============================================================================
// Stroke and fill
// ============================================================================

enum class StrokeType : uint8_t {
  Default,
  Dash,
  DashDot,
  DashDotDot,
  Dot,
  Solid,
};

template <>
struct EnumTraits<StrokeType>
{
  static constexpr std::string_view name = "stroke type";
  static std::optional<StrokeType> from_symbol(std::string_view s);
  static std::string_view to_symbol(StrokeType v);
};

/// `(stroke (width w) (type t) (color r g b a)?)`
struct Stroke
{
  static constexpr std::string_view k_keyword = "stroke";

  double width = 0.0;
  StrokeType type = StrokeType::Default;
  std::optional<Color> color;

  static Stroke from_sexpr(Parser parser);
  static Stroke from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Stroke & o) const
  {
    return width == o.width && type == o.type && color == o.color;
  }
  bool operator!=(const Stroke & o) const { return !(*this == o); }
};

enum class FillType : uint8_t {
  None,
  Outline,
  Background,
  Color,
};

template <>
struct EnumTraits<FillType>
{
  static constexpr std::string_view name = "fill type";
  static std::optional<FillType> from_symbol(std::string_view s);
  static std::string_view to_symbol(FillType v);
};

/// `(fill (type t) (color r g b a)?)`
struct Fill
{
  static constexpr std::string_view k_keyword = "fill";

  FillType type = FillType::None;
  std::optional<Color> color;

  static Fill from_sexpr(Parser parser);
  static Fill from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Fill & o) const { return type == o.type && color == o.color; }
  bool operator!=(const Fill & o) const { return !(*this == o); }
};

// ============================================================================
// Text
// ============================================================================

/// `(font (face "f")? (size h w) (thickness t)? bold? italic? (line_spacing n)? (color ...)?)`
struct Font
{
  static constexpr std::string_view k_keyword = "font";

  std::optional<std::string> face;
  double size_height = 0.0;
  double size_width = 0.0;
  std::optional<double> thickness;
  KeywordFlag bold;
  KeywordFlag italic;
  std::optional<double> line_spacing;
  std::optional<Color> color;

  static Font from_sexpr(Parser parser);
  static Font from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Font & o) const
  {
    return face == o.face && size_height == o.size_height && size_width == o.size_width &&
           thickness == o.thickness && bold == o.bold && italic == o.italic &&
           line_spacing == o.line_spacing && color == o.color;
  }
  bool operator!=(const Font & o) const { return !(*this == o); }
};

enum class JustifyHorizontal : uint8_t {
  Left,
  Right,
};

enum class JustifyVertical : uint8_t {
  Top,
  Bottom,
};

/// `(justify [left|right]? [top|bottom]? mirror?)`. Centered is the absent value.
struct Justify
{
  static constexpr std::string_view k_keyword = "justify";

  std::optional<JustifyHorizontal> horizontal;
  std::optional<JustifyVertical> vertical;
  bool mirror = false;

  static Justify from_sexpr(Parser parser);
  static Justify from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Justify & o) const
  {
    return horizontal == o.horizontal && vertical == o.vertical && mirror == o.mirror;
  }
  bool operator!=(const Justify & o) const { return !(*this == o); }
};

[[nodiscard]] std::string_view to_string(JustifyHorizontal v) noexcept;
[[nodiscard]] std::string_view to_string(JustifyVertical v) noexcept;

/// `(effects font justify? [hide | (hide b)])`
struct TextEffects
{
  static constexpr std::string_view k_keyword = "effects";

  Font font;
  std::optional<Justify> justify;
  KeywordFlag hide;

  static TextEffects from_sexpr(Parser parser);
  static TextEffects from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const TextEffects & o) const
  {
    return font == o.font && justify == o.justify && hide == o.hide;
  }
  bool operator!=(const TextEffects & o) const { return !(*this == o); }
};

}  // namespace kicad_format
