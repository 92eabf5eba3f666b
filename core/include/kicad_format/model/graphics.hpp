// kicad_format/model/graphics.hpp - Graphic items drawn in symbol bodies
#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "kicad_format/model/common.hpp"

namespace kicad_format
{

/// `(arc (start x y) (mid x y) (end x y) stroke fill)`
struct Arc
{
  static constexpr std::string_view k_keyword = "arc";

  Point start;
  Point mid;
  Point end;
  Stroke stroke;
  Fill fill;

  static Arc from_sexpr(Parser parser);
  static Arc from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Arc & o) const
  {
    return start == o.start && mid == o.mid && end == o.end && stroke == o.stroke &&
           fill == o.fill;
  }
};

/// `(circle (center x y) (radius r) stroke fill)`
struct Circle
{
  static constexpr std::string_view k_keyword = "circle";

  Point center;
  double radius = 0.0;
  Stroke stroke;
  Fill fill;

  static Circle from_sexpr(Parser parser);
  static Circle from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Circle & o) const
  {
    return center == o.center && radius == o.radius && stroke == o.stroke && fill == o.fill;
  }
};

/// `(bezier (pts (xy x y)*) stroke fill)`
struct Bezier
{
  static constexpr std::string_view k_keyword = "bezier";

  std::vector<Point> points;
  Stroke stroke;
  Fill fill;

  static Bezier from_sexpr(Parser parser);
  static Bezier from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Bezier & o) const
  {
    return points == o.points && stroke == o.stroke && fill == o.fill;
  }
};

/// `(polyline (pts (xy x y)*) stroke fill)`
struct Polyline
{
  static constexpr std::string_view k_keyword = "polyline";

  std::vector<Point> points;
  Stroke stroke;
  Fill fill;

  static Polyline from_sexpr(Parser parser);
  static Polyline from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Polyline & o) const
  {
    return points == o.points && stroke == o.stroke && fill == o.fill;
  }
};

/// `(rectangle (start x y) (end x y) stroke fill)`
struct Rectangle
{
  static constexpr std::string_view k_keyword = "rectangle";

  Point start;
  Point end;
  Stroke stroke;
  Fill fill;

  static Rectangle from_sexpr(Parser parser);
  static Rectangle from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Rectangle & o) const
  {
    return start == o.start && end == o.end && stroke == o.stroke && fill == o.fill;
  }
};

/// `(text "t" (at x y a?) effects)`
struct Text
{
  static constexpr std::string_view k_keyword = "text";

  std::string text;
  Position position;
  TextEffects effects;

  static Text from_sexpr(Parser parser);
  static Text from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const Text & o) const
  {
    return text == o.text && position == o.position && effects == o.effects;
  }
};

/**
 * Any one graphic item. The presence test accepts every item keyword, and
 * parsing dispatches on the keyword.
 */
struct GraphicItem
{
  // Each alternative tags errors with its own keyword.
  static constexpr std::string_view k_keyword = "";

  std::variant<Arc, Circle, Bezier, Polyline, Rectangle, Text> item;

  static GraphicItem from_sexpr(Parser parser);
  static GraphicItem from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list);
  static bool is_present_ref(const ListNode & list);
  [[nodiscard]] Sexpr to_sexpr() const;

  /// Keyword of the held alternative.
  [[nodiscard]] std::string_view keyword() const;

  bool operator==(const GraphicItem & o) const { return item == o.item; }
  bool operator!=(const GraphicItem & o) const { return !(*this == o); }
};

}  // namespace kicad_format
