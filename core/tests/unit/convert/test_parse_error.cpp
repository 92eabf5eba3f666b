// tests/unit/convert/test_parse_error.cpp - Error messages, codes and diagnostics
#include <gtest/gtest.h>

#include "kicad_format/convert/parse_error.hpp"

using namespace kicad_format;

TEST(ParseError, MessagesComeFromFields)
{
  EXPECT_EQ(ParseError::unexpected_end_of_list().message(), "unexpected end of list");
  EXPECT_EQ(
    ParseError::unexpected_token_kind(SexprKind::String, SexprKind::Symbol).message(),
    "expected string, found symbol");
  EXPECT_EQ(
    ParseError::unexpected_token_kind(SexprKind::List).message(), "expected list");
  EXPECT_EQ(
    ParseError::invalid_enum_value("sideways", "fill type").message(),
    "invalid value 'sideways' for fill type");
  EXPECT_EQ(
    ParseError::library_identifier_malformed(":R", "empty library").message(),
    "malformed library identifier ':R': empty library");
}

TEST(ParseError, ContextReadsOutermostFirst)
{
  ParseError e = ParseError::unexpected_end_of_list();
  e.push_context("font");
  e.push_context("effects");
  e.push_context("property");

  ASSERT_EQ(e.context().size(), 3u);
  EXPECT_EQ(e.context().front(), "font");
  EXPECT_EQ(e.context_string(), "in 'property' > in 'effects' > in 'font'");
  EXPECT_EQ(
    std::string(e.what()),
    "unexpected end of list (in 'property' > in 'effects' > in 'font')");
}

TEST(ParseError, InnermostRangeWins)
{
  ParseError e = ParseError::unexpected_end_of_list();
  e.set_range_if_unset(SourceRange(FileId{0}, 5, 6));
  e.set_range_if_unset(SourceRange(FileId{0}, 0, 20));
  ASSERT_TRUE(e.range());
  EXPECT_EQ(e.range()->get_begin().offset(), 5u);
}

TEST(ParseError, EqualityIgnoresRange)
{
  ParseError a = ParseError::non_matching_symbol("a", "b");
  const ParseError b = ParseError::non_matching_symbol("a", "b");
  a.set_range_if_unset(SourceRange(FileId{0}, 1, 2));
  EXPECT_EQ(a, b);

  a.push_context("symbol");
  EXPECT_FALSE(a == b);
}

TEST(ParseError, KindsHaveStableCodes)
{
  EXPECT_EQ(error_code(ParseErrorKind::UnexpectedEndOfList), "K0101");
  EXPECT_EQ(error_code(ParseErrorKind::NonMatchingSymbol), "K0103");
  EXPECT_EQ(error_code(ParseErrorKind::LibraryIdentifierMalformed), "K0106");
  EXPECT_EQ(to_string(ParseErrorKind::ExpectedEndOfList), "ExpectedEndOfList");
}

TEST(ParseError, ConvertsToDiagnostic)
{
  ParseError e = ParseError::library_identifier_malformed("a:b:c", "name contains ':'");
  e.set_range_if_unset(SourceRange(FileId{0}, 8, 15));
  e.push_context("symbol");

  const Diagnostic d = to_diagnostic(e);
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "K0106");
  EXPECT_EQ(d.primary_range(), SourceRange(FileId{0}, 8, 15));
  ASSERT_EQ(d.notes.size(), 1u);
  EXPECT_EQ(d.notes[0], "in 'symbol'");
  EXPECT_TRUE(d.help_message.has_value());
}

TEST(ParseError, SyntaxErrorDiagnostic)
{
  const Diagnostic d = to_diagnostic(SyntaxError{"unclosed '('", SourceRange(FileId{1}, 0, 1)});
  EXPECT_EQ(d.code, "K0001");
  EXPECT_EQ(d.message, "unclosed '('");
  EXPECT_EQ(d.primary_range().file_id(), FileId{1});
}
