// tests/unit/model/test_symbol_library.cpp - Library file entry points
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <variant>

#include "kicad_format/model/symbol_library.hpp"
#include "kicad_format/sexpr/sexpr_context.hpp"
#include "kicad_format/sexpr/writer.hpp"
#include "kicad_format/test_support/parse_helpers.hpp"

using namespace kicad_format;
using test_support::read_or_throw;

namespace
{

/// Parse with both strategies, require success and agreement.
SymbolLibraryFile parse_agreeing(std::string_view text)
{
  LibraryLoadResult owned = parse_symbol_library(text);
  LibraryLoadResult borrowed = parse_symbol_library_fast(text);
  if (!owned) {
    ADD_FAILURE() << "owning parse failed: " << owned.error().message();
    return {};
  }
  if (!borrowed) {
    ADD_FAILURE() << "borrowing parse failed: " << borrowed.error().message();
    return {};
  }
  EXPECT_EQ(owned.value(), borrowed.value());
  EXPECT_EQ(owned->to_sexpr(), borrowed->to_sexpr());
  return std::move(owned).value();
}

constexpr std::string_view k_scenario =
  "(kicad_symbol_lib (version 20211014) (generator kicad_symbol_editor) "
  "(symbol \"Device:R\" (in_bom yes) (on_board yes)))";

}  // namespace

// ============================================================================
// Scenario and boundaries
// ============================================================================

TEST(SymbolLibrary, ScenarioModelAndSerialization)
{
  const SymbolLibraryFile lib = parse_agreeing(k_scenario);

  EXPECT_EQ(lib.version, 20211014u);
  EXPECT_EQ(lib.generator, "kicad_symbol_editor");
  EXPECT_FALSE(lib.generator_is_string);
  EXPECT_FALSE(lib.generator_version.has_value());
  ASSERT_EQ(lib.symbols.size(), 1u);

  const LibSymbol * root = lib.symbols[0].as_root();
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->id.to_string(), "Device:R");
  EXPECT_TRUE(root->in_bom);
  EXPECT_TRUE(root->on_board);
  EXPECT_TRUE(root->properties.empty());
  EXPECT_TRUE(root->units.empty());

  EXPECT_EQ(lib.to_sexpr(), read_or_throw(k_scenario));
}

TEST(SymbolLibrary, EmptyLibrary)
{
  constexpr std::string_view text = "(kicad_symbol_lib (version 20211014) (generator \"x\"))";
  const SymbolLibraryFile lib = parse_agreeing(text);
  EXPECT_TRUE(lib.symbols.empty());
  EXPECT_TRUE(lib.generator_is_string);
  EXPECT_EQ(lib.to_sexpr(), read_or_throw(text));
}

TEST(SymbolLibrary, GeneratorSpellingsAreEquivalent)
{
  const SymbolLibraryFile legacy =
    parse_agreeing("(kicad_symbol_lib (version 20211014) (generator kicad_symbol_editor))");
  const SymbolLibraryFile current =
    parse_agreeing("(kicad_symbol_lib (version 20211014) (generator \"kicad_symbol_editor\"))");

  EXPECT_EQ(legacy.generator, current.generator);
  EXPECT_FALSE(legacy.generator_is_string);
  EXPECT_TRUE(current.generator_is_string);

  const SexprList & legacy_items = *legacy.to_sexpr().as_list();
  const SexprList & current_items = *current.to_sexpr().as_list();
  EXPECT_EQ(legacy_items[2], Sexpr::symbol_with_name("generator", "kicad_symbol_editor"));
  EXPECT_EQ(current_items[2], Sexpr::string_with_name("generator", "kicad_symbol_editor"));
}

TEST(SymbolLibrary, GeneratorVersion)
{
  constexpr std::string_view text =
    "(kicad_symbol_lib (version 20231120) (generator \"kicad_symbol_editor\") "
    "(generator_version \"8.0\"))";
  const SymbolLibraryFile lib = parse_agreeing(text);
  EXPECT_EQ(lib.generator_version, "8.0");
  EXPECT_EQ(lib.to_sexpr(), read_or_throw(text));
}

TEST(SymbolLibrary, ReparseOfSerializationIsStable)
{
  const SymbolLibraryFile first = parse_agreeing(k_scenario);
  const std::string text = write_sexpr(first.to_sexpr());
  const SymbolLibraryFile second = parse_agreeing(text);
  EXPECT_EQ(first, second);
}

TEST(SymbolLibrary, ParsesAnAlreadyReadTree)
{
  const auto result = parse_symbol_library(read_or_throw(k_scenario));
  ASSERT_TRUE(result);
  EXPECT_EQ(result->symbols.size(), 1u);

  SexprContext ctx;
  const auto root = ctx.read(k_scenario);
  ASSERT_TRUE(root);
  const auto fast = parse_symbol_library_fast(*root.value());
  ASSERT_TRUE(fast);
  EXPECT_EQ(fast.value(), result.value());
}

// ============================================================================
// Failures
// ============================================================================

TEST(SymbolLibrary, MissingInBomFailsOnBothPaths)
{
  constexpr std::string_view text =
    "(kicad_symbol_lib (version 20211014) (generator x) (symbol \"Device:R\" (on_board yes)))";

  const auto owned = parse_symbol_library(text);
  const auto borrowed = parse_symbol_library_fast(text);
  ASSERT_FALSE(owned);
  ASSERT_FALSE(borrowed);
  ASSERT_FALSE(owned.error().is_syntax_error());

  const ParseError & e = std::get<ParseError>(owned.error().error);
  EXPECT_EQ(e.kind(), ParseErrorKind::NonMatchingSymbol);
  EXPECT_EQ(e.context_string(), "in 'kicad_symbol_lib' > in 'symbol'");
  EXPECT_EQ(e, std::get<ParseError>(borrowed.error().error));
}

TEST(SymbolLibrary, BorrowingErrorsPointIntoTheSource)
{
  test_support::TestSourceUnit unit = test_support::make_source(
    "(kicad_symbol_lib (version 20211014) (generator x)\n"
    "  (symbol \"Device:R\" (on_board yes)))");

  const auto result = parse_symbol_library_fast(unit.text(), unit.file_id);
  ASSERT_FALSE(result);
  const Diagnostic diag = result.error().to_diagnostic();
  EXPECT_EQ(diag.code, "K0103");

  const FullSourceRange fr = unit.full_range(diag.primary_range());
  ASSERT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 2u);
  EXPECT_EQ(fr.start_column, 23u);
}

TEST(SymbolLibrary, VersionMustBeAnUnsignedInteger)
{
  for (const char * version : {"-1", "1e20", "20211014.5", "4294967296"}) {
    const std::string text =
      std::string("(kicad_symbol_lib (version ") + version + ") (generator x))";
    const auto owned = parse_symbol_library(text);
    const auto borrowed = parse_symbol_library_fast(text);
    ASSERT_FALSE(owned) << version;
    ASSERT_FALSE(borrowed) << version;
    ASSERT_FALSE(owned.error().is_syntax_error()) << version;

    const ParseError & e = std::get<ParseError>(owned.error().error);
    EXPECT_EQ(e.kind(), ParseErrorKind::InvalidEnumValue) << version;
    EXPECT_EQ(e.detail_if<InvalidEnumValue>()->enum_name, "version") << version;
    EXPECT_EQ(e, std::get<ParseError>(borrowed.error().error)) << version;
  }
}

TEST(SymbolLibrary, VersionErrorPointsAtTheNumber)
{
  test_support::TestSourceUnit unit =
    test_support::make_source("(kicad_symbol_lib (version -1) (generator x))");

  const auto result = parse_symbol_library_fast(unit.text(), unit.file_id);
  ASSERT_FALSE(result);
  const ParseError & e = std::get<ParseError>(result.error().error);
  ASSERT_TRUE(e.range());
  EXPECT_EQ(e.range()->get_begin().offset(), 27u);
  EXPECT_EQ(e.range()->size(), 2u);
  EXPECT_EQ(result.error().to_diagnostic().code, "K0104");
}

TEST(SymbolLibrary, VersionBoundsRoundTrip)
{
  for (const char * version : {"0", "4294967295"}) {
    const std::string text =
      std::string("(kicad_symbol_lib (version ") + version + ") (generator x))";
    const SymbolLibraryFile lib = parse_agreeing(text);
    EXPECT_EQ(lib.to_sexpr(), read_or_throw(text)) << version;
  }
  EXPECT_EQ(parse_agreeing("(kicad_symbol_lib (version 4294967295) (generator x))").version,
            4294967295u);
}

TEST(SymbolLibrary, SyntaxErrorsAreReportedSeparately)
{
  for (const auto & result :
       {parse_symbol_library("(kicad_symbol_lib (version 1)"),
        parse_symbol_library_fast("(kicad_symbol_lib (version 1)")}) {
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().is_syntax_error());
    EXPECT_EQ(result.error().message(), "unclosed '('");
    EXPECT_EQ(result.error().to_diagnostic().code, "K0001");
  }
}

TEST(SymbolLibrary, WrongRootKeyword)
{
  const auto result = parse_symbol_library_fast("(kicad_sch (version 20211014))");
  ASSERT_FALSE(result);
  const ParseError & e = std::get<ParseError>(result.error().error);
  EXPECT_EQ(e.detail_if<NonMatchingSymbol>()->found, "kicad_sch");
}

TEST(SymbolLibrary, AtomRootIsRejected)
{
  for (const auto & result : {parse_symbol_library("42"), parse_symbol_library_fast("42")}) {
    ASSERT_FALSE(result);
    const ParseError & e = std::get<ParseError>(result.error().error);
    EXPECT_EQ(e.kind(), ParseErrorKind::UnexpectedTokenKind);
  }
}
