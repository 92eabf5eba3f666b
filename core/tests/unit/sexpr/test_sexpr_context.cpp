// tests/unit/sexpr/test_sexpr_context.cpp - Arena-backed token trees
#include <gtest/gtest.h>

#include <string>

#include "kicad_format/basic/casting.hpp"
#include "kicad_format/sexpr/reader.hpp"
#include "kicad_format/sexpr/sexpr_context.hpp"

using namespace kicad_format;

TEST(SexprContext, BuildsNodesWithRanges)
{
  SexprContext ctx;
  const auto root = ctx.read("(at 1 -2 \"s\")", FileId{0});
  ASSERT_TRUE(root);

  const auto * list = dyn_cast<ListNode>(root.value());
  ASSERT_NE(list, nullptr);
  ASSERT_EQ(list->size(), 4u);
  EXPECT_TRUE(list->has_name("at"));
  EXPECT_EQ(list->range.get_begin().offset(), 0u);
  EXPECT_EQ(list->range.get_end().offset(), 13u);

  ASSERT_TRUE(isa<NumberNode>(list->children[1]));
  EXPECT_EQ(cast<NumberNode>(list->children[2])->value, -2.0);

  const auto * str = dyn_cast<StringNode>(list->children[3]);
  ASSERT_NE(str, nullptr);
  EXPECT_EQ(str->text, "s");
  EXPECT_EQ(str->range.get_begin().offset(), 9u);

  EXPECT_EQ(ctx.node_count(), 5u);
}

TEST(SexprContext, OwnsItsCopyOfTheText)
{
  SexprContext ctx;
  std::string text = "(name \"abc\")";
  const auto root = ctx.read(text);
  ASSERT_TRUE(root);

  text.assign(text.size(), 'x');

  const auto * list = cast<ListNode>(root.value());
  EXPECT_EQ(cast<SymbolNode>(list->children[0])->text, "name");
  EXPECT_EQ(cast<StringNode>(list->children[1])->text, "abc");
  EXPECT_EQ(ctx.source(), "(name \"abc\")");
}

TEST(SexprContext, UnescapesStringsIntoTheArena)
{
  SexprContext ctx;
  const auto root = ctx.read("(v \"a\\\"b\")");
  ASSERT_TRUE(root);
  const auto * list = cast<ListNode>(root.value());
  EXPECT_EQ(cast<StringNode>(list->children[1])->text, "a\"b");
}

TEST(SexprContext, ReportsTheSameErrorsAsTheReader)
{
  for (const char * text : {"", "(a", "(a))", "(\"x"}) {
    SexprContext ctx;
    const auto borrowed = ctx.read(text);
    const auto owned = read_sexpr(text);
    ASSERT_FALSE(borrowed) << text;
    ASSERT_FALSE(owned) << text;
    EXPECT_EQ(borrowed.error().message, owned.error().message) << text;
    EXPECT_EQ(borrowed.error().range, owned.error().range) << text;
  }
}

TEST(SexprContext, MaterializeMatchesReader)
{
  const char * text = "(symbol \"Device:R\" (pin_numbers hide) (in_bom yes) (at 0 -1.27 90))";
  SexprContext ctx;
  const auto root = ctx.read(text);
  const auto owned = read_sexpr(text);
  ASSERT_TRUE(root);
  ASSERT_TRUE(owned);
  EXPECT_EQ(materialize(*root.value()), owned.value());
}

TEST(SexprContext, EmptyListHasNoName)
{
  SexprContext ctx;
  const auto root = ctx.read("()");
  ASSERT_TRUE(root);
  const auto * list = cast<ListNode>(root.value());
  EXPECT_TRUE(list->empty());
  EXPECT_FALSE(list->has_name(""));
}
