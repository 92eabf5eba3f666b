// kicad_format/model/graphics.cpp - Graphic item grammar
#include "kicad_format/model/graphics.hpp"

#include <type_traits>

namespace kicad_format
{
namespace
{

template <typename T>
T parse_entity(Parser & p)
{
  return T::from_sexpr(p);
}

template <typename T>
T parse_entity(ParserRef & p)
{
  return T::from_sexpr_ref(p);
}

std::string_view head_symbol(const Parser & p)
{
  const Sexpr * head = p.peek();
  const std::string * s = head != nullptr ? head->as_symbol() : nullptr;
  return s != nullptr ? std::string_view(*s) : std::string_view();
}

std::string_view head_symbol(const ParserRef & p)
{
  const auto * head = dyn_cast<SymbolNode>(p.peek());
  return head != nullptr ? head->text : std::string_view();
}

template <typename P>
std::vector<Point> parse_pts(P & p)
{
  auto pts = p.expect_list_with_name("pts");
  std::vector<Point> out;
  while (!pts.at_end()) {
    out.push_back(detail::parse_point(pts, "xy"));
  }
  return out;
}

Sexpr pts_to_sexpr(const std::vector<Point> & points)
{
  SexprList items;
  items.reserve(points.size());
  for (const auto & pt : points) {
    items.push_back(pt.to_sexpr("xy"));
  }
  return Sexpr::list_with_name("pts", std::move(items));
}

// ============================================================================
// Grammar
// ============================================================================

template <typename P>
Arc parse_arc(P & p)
{
  p.expect_symbol_matching(Arc::k_keyword);
  Arc a;
  a.start = detail::parse_point(p, "start");
  a.mid = detail::parse_point(p, "mid");
  a.end = detail::parse_point(p, "end");
  a.stroke = p.template expect<Stroke>();
  a.fill = p.template expect<Fill>();
  p.expect_end();
  return a;
}

template <typename P>
Circle parse_circle(P & p)
{
  p.expect_symbol_matching(Circle::k_keyword);
  Circle c;
  c.center = detail::parse_point(p, "center");
  c.radius = p.expect_number_with_name("radius");
  c.stroke = p.template expect<Stroke>();
  c.fill = p.template expect<Fill>();
  p.expect_end();
  return c;
}

template <typename T, typename P>
T parse_point_path(P & p)
{
  p.expect_symbol_matching(T::k_keyword);
  T item;
  item.points = parse_pts(p);
  item.stroke = p.template expect<Stroke>();
  item.fill = p.template expect<Fill>();
  p.expect_end();
  return item;
}

template <typename P>
Rectangle parse_rectangle(P & p)
{
  p.expect_symbol_matching(Rectangle::k_keyword);
  Rectangle r;
  r.start = detail::parse_point(p, "start");
  r.end = detail::parse_point(p, "end");
  r.stroke = p.template expect<Stroke>();
  r.fill = p.template expect<Fill>();
  p.expect_end();
  return r;
}

template <typename P>
Text parse_text(P & p)
{
  p.expect_symbol_matching(Text::k_keyword);
  Text t;
  t.text = std::string(p.expect_string());
  t.position = p.template expect<Position>();
  t.effects = p.template expect<TextEffects>();
  p.expect_end();
  return t;
}

template <typename T, typename P>
GraphicItem parse_tagged(P & p)
{
  try {
    return GraphicItem{parse_entity<T>(p)};
  } catch (ParseError & e) {
    e.push_context(T::k_keyword);
    throw;
  }
}

template <typename P>
GraphicItem parse_graphic_item(P & p)
{
  const std::string_view head = head_symbol(p);
  if (head == Arc::k_keyword) return parse_tagged<Arc>(p);
  if (head == Circle::k_keyword) return parse_tagged<Circle>(p);
  if (head == Bezier::k_keyword) return parse_tagged<Bezier>(p);
  if (head == Polyline::k_keyword) return parse_tagged<Polyline>(p);
  if (head == Rectangle::k_keyword) return parse_tagged<Rectangle>(p);
  if (head == Text::k_keyword) return parse_tagged<Text>(p);
  throw ParseError::invalid_enum_value(std::string(head), "graphic item");
}

}  // namespace

// ============================================================================
// Entities
// ============================================================================

Arc Arc::from_sexpr(Parser parser) { return parse_arc(parser); }
Arc Arc::from_sexpr_ref(ParserRef parser) { return parse_arc(parser); }

Sexpr Arc::to_sexpr() const
{
  return Sexpr::list_with_name(
    k_keyword, {start.to_sexpr("start"), mid.to_sexpr("mid"), end.to_sexpr("end"),
                stroke.to_sexpr(), fill.to_sexpr()});
}

Circle Circle::from_sexpr(Parser parser) { return parse_circle(parser); }
Circle Circle::from_sexpr_ref(ParserRef parser) { return parse_circle(parser); }

Sexpr Circle::to_sexpr() const
{
  return Sexpr::list_with_name(
    k_keyword, {center.to_sexpr("center"), Sexpr::number_with_name("radius", radius),
                stroke.to_sexpr(), fill.to_sexpr()});
}

Bezier Bezier::from_sexpr(Parser parser) { return parse_point_path<Bezier>(parser); }
Bezier Bezier::from_sexpr_ref(ParserRef parser) { return parse_point_path<Bezier>(parser); }

Sexpr Bezier::to_sexpr() const
{
  return Sexpr::list_with_name(
    k_keyword, {pts_to_sexpr(points), stroke.to_sexpr(), fill.to_sexpr()});
}

Polyline Polyline::from_sexpr(Parser parser) { return parse_point_path<Polyline>(parser); }
Polyline Polyline::from_sexpr_ref(ParserRef parser)
{
  return parse_point_path<Polyline>(parser);
}

Sexpr Polyline::to_sexpr() const
{
  return Sexpr::list_with_name(
    k_keyword, {pts_to_sexpr(points), stroke.to_sexpr(), fill.to_sexpr()});
}

Rectangle Rectangle::from_sexpr(Parser parser) { return parse_rectangle(parser); }
Rectangle Rectangle::from_sexpr_ref(ParserRef parser) { return parse_rectangle(parser); }

Sexpr Rectangle::to_sexpr() const
{
  return Sexpr::list_with_name(
    k_keyword, {start.to_sexpr("start"), end.to_sexpr("end"), stroke.to_sexpr(),
                fill.to_sexpr()});
}

Text Text::from_sexpr(Parser parser) { return parse_text(parser); }
Text Text::from_sexpr_ref(ParserRef parser) { return parse_text(parser); }

Sexpr Text::to_sexpr() const
{
  return Sexpr::list_with_name(
    k_keyword, {Sexpr::string(text), position.to_sexpr(), effects.to_sexpr()});
}

// ============================================================================
// GraphicItem
// ============================================================================

GraphicItem GraphicItem::from_sexpr(Parser parser) { return parse_graphic_item(parser); }
GraphicItem GraphicItem::from_sexpr_ref(ParserRef parser) { return parse_graphic_item(parser); }

bool GraphicItem::is_present(const SexprList & list)
{
  return Arc::is_present(list) || Circle::is_present(list) || Bezier::is_present(list) ||
         Polyline::is_present(list) || Rectangle::is_present(list) || Text::is_present(list);
}

bool GraphicItem::is_present_ref(const ListNode & list)
{
  return Arc::is_present_ref(list) || Circle::is_present_ref(list) ||
         Bezier::is_present_ref(list) || Polyline::is_present_ref(list) ||
         Rectangle::is_present_ref(list) || Text::is_present_ref(list);
}

Sexpr GraphicItem::to_sexpr() const
{
  return std::visit([](const auto & g) { return g.to_sexpr(); }, item);
}

std::string_view GraphicItem::keyword() const
{
  return std::visit([](const auto & g) { return std::decay_t<decltype(g)>::k_keyword; }, item);
}

}  // namespace kicad_format
