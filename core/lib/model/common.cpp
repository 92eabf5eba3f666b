// kicad_format/model/common.cpp - Grammar of the shared leaf entities
//
// Each grammar is written once as a template over the cursor type, so the
// owning and borrowing paths cannot drift apart.
//
#include "kicad_format/model/common.hpp"

#include <utility>

namespace kicad_format
{
namespace
{

constexpr EnumTable<StrokeType, 6> k_stroke_types = {{
  {"default", StrokeType::Default},
  {"dash", StrokeType::Dash},
  {"dash_dot", StrokeType::DashDot},
  {"dash_dot_dot", StrokeType::DashDotDot},
  {"dot", StrokeType::Dot},
  {"solid", StrokeType::Solid},
}};

constexpr EnumTable<FillType, 4> k_fill_types = {{
  {"none", FillType::None},
  {"outline", FillType::Outline},
  {"background", FillType::Background},
  {"color", FillType::Color},
}};

// ============================================================================
// Grammar
// ============================================================================

template <typename P>
Position parse_position(P & p)
{
  p.expect_symbol_matching(Position::k_keyword);
  Position pos;
  pos.x = p.expect_number();
  pos.y = p.expect_number();
  pos.angle = p.maybe_number();
  p.expect_end();
  return pos;
}

template <typename P>
Color parse_color(P & p)
{
  p.expect_symbol_matching(Color::k_keyword);
  Color c;
  c.r = p.expect_number();
  c.g = p.expect_number();
  c.b = p.expect_number();
  c.a = p.expect_number();
  p.expect_end();
  return c;
}

template <typename P>
Stroke parse_stroke(P & p)
{
  p.expect_symbol_matching(Stroke::k_keyword);
  Stroke s;
  s.width = p.expect_number_with_name("width");
  {
    auto type = p.expect_list_with_name("type");
    s.type = type.template expect_enum<StrokeType>();
    type.expect_end();
  }
  s.color = p.template maybe<Color>();
  p.expect_end();
  return s;
}

template <typename P>
Fill parse_fill(P & p)
{
  p.expect_symbol_matching(Fill::k_keyword);
  Fill f;
  {
    auto type = p.expect_list_with_name("type");
    f.type = type.template expect_enum<FillType>();
    type.expect_end();
  }
  f.color = p.template maybe<Color>();
  p.expect_end();
  return f;
}

template <typename P>
Font parse_font(P & p)
{
  p.expect_symbol_matching(Font::k_keyword);
  Font f;
  if (auto face = p.maybe_string_with_name("face")) {
    f.face = std::string(*face);
  }
  {
    auto size = p.expect_list_with_name("size");
    f.size_height = size.expect_number();
    f.size_width = size.expect_number();
    size.expect_end();
  }
  f.thickness = p.maybe_number_with_name("thickness");
  f.bold = p.maybe_keyword_flag("bold");
  f.italic = p.maybe_keyword_flag("italic");
  f.line_spacing = p.maybe_number_with_name("line_spacing");
  f.color = p.template maybe<Color>();
  p.expect_end();
  return f;
}

template <typename P>
Justify parse_justify(P & p)
{
  p.expect_symbol_matching(Justify::k_keyword);
  Justify j;
  if (p.maybe_symbol_matching("left")) {
    j.horizontal = JustifyHorizontal::Left;
  } else if (p.maybe_symbol_matching("right")) {
    j.horizontal = JustifyHorizontal::Right;
  }
  if (p.maybe_symbol_matching("top")) {
    j.vertical = JustifyVertical::Top;
  } else if (p.maybe_symbol_matching("bottom")) {
    j.vertical = JustifyVertical::Bottom;
  }
  j.mirror = p.maybe_symbol_matching("mirror");
  p.expect_end();
  return j;
}

template <typename P>
TextEffects parse_effects(P & p)
{
  p.expect_symbol_matching(TextEffects::k_keyword);
  TextEffects e;
  e.font = p.template expect<Font>();
  e.justify = p.template maybe<Justify>();
  e.hide = p.maybe_keyword_flag("hide");
  p.expect_end();
  return e;
}

}  // namespace

// ============================================================================
// Enumerations
// ============================================================================

std::optional<StrokeType> EnumTraits<StrokeType>::from_symbol(std::string_view s)
{
  return lookup_enum(k_stroke_types, s);
}

std::string_view EnumTraits<StrokeType>::to_symbol(StrokeType v)
{
  return lookup_enum_symbol(k_stroke_types, v);
}

std::optional<FillType> EnumTraits<FillType>::from_symbol(std::string_view s)
{
  return lookup_enum(k_fill_types, s);
}

std::string_view EnumTraits<FillType>::to_symbol(FillType v)
{
  return lookup_enum_symbol(k_fill_types, v);
}

std::string_view to_string(JustifyHorizontal v) noexcept
{
  return v == JustifyHorizontal::Left ? "left" : "right";
}

std::string_view to_string(JustifyVertical v) noexcept
{
  return v == JustifyVertical::Top ? "top" : "bottom";
}

// ============================================================================
// Point / Position / Color
// ============================================================================

Sexpr Point::to_sexpr(std::string_view keyword) const
{
  return Sexpr::list_with_name(keyword, {Sexpr::number(x), Sexpr::number(y)});
}

Position Position::from_sexpr(Parser parser) { return parse_position(parser); }
Position Position::from_sexpr_ref(ParserRef parser) { return parse_position(parser); }

Sexpr Position::to_sexpr() const
{
  SexprList items{Sexpr::number(x), Sexpr::number(y)};
  if (angle) {
    items.push_back(Sexpr::number(*angle));
  }
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

Color Color::from_sexpr(Parser parser) { return parse_color(parser); }
Color Color::from_sexpr_ref(ParserRef parser) { return parse_color(parser); }

Sexpr Color::to_sexpr() const
{
  return Sexpr::list_with_name(
    k_keyword, {Sexpr::number(r), Sexpr::number(g), Sexpr::number(b), Sexpr::number(a)});
}

// ============================================================================
// Stroke / Fill
// ============================================================================

Stroke Stroke::from_sexpr(Parser parser) { return parse_stroke(parser); }
Stroke Stroke::from_sexpr_ref(ParserRef parser) { return parse_stroke(parser); }

Sexpr Stroke::to_sexpr() const
{
  SexprList items{
    Sexpr::number_with_name("width", width),
    Sexpr::symbol_with_name("type", EnumTraits<StrokeType>::to_symbol(type))};
  if (color) {
    items.push_back(color->to_sexpr());
  }
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

Fill Fill::from_sexpr(Parser parser) { return parse_fill(parser); }
Fill Fill::from_sexpr_ref(ParserRef parser) { return parse_fill(parser); }

Sexpr Fill::to_sexpr() const
{
  SexprList items{Sexpr::symbol_with_name("type", EnumTraits<FillType>::to_symbol(type))};
  if (color) {
    items.push_back(color->to_sexpr());
  }
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

// ============================================================================
// Font / Justify / TextEffects
// ============================================================================

Font Font::from_sexpr(Parser parser) { return parse_font(parser); }
Font Font::from_sexpr_ref(ParserRef parser) { return parse_font(parser); }

Sexpr Font::to_sexpr() const
{
  SexprList items;
  if (face) {
    items.push_back(Sexpr::string_with_name("face", *face));
  }
  items.push_back(
    Sexpr::list_with_name("size", {Sexpr::number(size_height), Sexpr::number(size_width)}));
  if (thickness) {
    items.push_back(Sexpr::number_with_name("thickness", *thickness));
  }
  bold.append_to(items, "bold");
  italic.append_to(items, "italic");
  if (line_spacing) {
    items.push_back(Sexpr::number_with_name("line_spacing", *line_spacing));
  }
  if (color) {
    items.push_back(color->to_sexpr());
  }
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

Justify Justify::from_sexpr(Parser parser) { return parse_justify(parser); }
Justify Justify::from_sexpr_ref(ParserRef parser) { return parse_justify(parser); }

Sexpr Justify::to_sexpr() const
{
  SexprList items;
  if (horizontal) {
    items.push_back(Sexpr::symbol(std::string(to_string(*horizontal))));
  }
  if (vertical) {
    items.push_back(Sexpr::symbol(std::string(to_string(*vertical))));
  }
  if (mirror) {
    items.push_back(Sexpr::symbol("mirror"));
  }
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

TextEffects TextEffects::from_sexpr(Parser parser) { return parse_effects(parser); }
TextEffects TextEffects::from_sexpr_ref(ParserRef parser) { return parse_effects(parser); }

Sexpr TextEffects::to_sexpr() const
{
  SexprList items{font.to_sexpr()};
  if (justify) {
    items.push_back(justify->to_sexpr());
  }
  hide.append_to(items, "hide");
  return Sexpr::list_with_name(k_keyword, std::move(items));
}

}  // namespace kicad_format
