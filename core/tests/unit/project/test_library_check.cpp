// tests/unit/project/test_library_check.cpp - Checks behind kfmt check/roundtrip
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "kicad_format/basic/diagnostic_printer.hpp"
#include "kicad_format/project/library_check.hpp"

using namespace kicad_format;

namespace
{

constexpr std::string_view k_library =
  "(kicad_symbol_lib (version 20211014) (generator kicad_symbol_editor) "
  "(symbol \"R\" (in_bom yes) (on_board yes)) "
  "(symbol \"C\" (in_bom yes) (on_board yes)))";

struct Input
{
  SourceRegistry sources;
  FileId file;
  std::string_view text;

  explicit Input(std::string_view content)
  {
    file = sources.add("Device.kicad_sym", std::string(content));
    text = sources.file(file)->content();
  }
};

SymbolLibraryFile load_or_fail(const Input & input)
{
  DiagnosticBag diags;
  auto lib = load_library(input.text, input.file, ParseStrategy::Owning, diags);
  EXPECT_TRUE(lib);
  EXPECT_TRUE(diags.empty());
  return lib ? *lib : SymbolLibraryFile{};
}

std::string render(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::ostringstream out;
  DiagnosticPrinter printer(out, /*use_color=*/false);
  printer.print_all(diags, sources);
  return out.str();
}

}  // namespace

// ============================================================================
// Loading
// ============================================================================

TEST(LibraryCheck, ParseFailureLandsInTheBag)
{
  for (const ParseStrategy strategy : {ParseStrategy::Owning, ParseStrategy::Borrowing}) {
    Input input("(kicad_symbol_lib (version -1) (generator x))");
    DiagnosticBag diags;
    EXPECT_FALSE(load_library(input.text, input.file, strategy, diags));
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_TRUE(diags.has_errors());
    EXPECT_EQ(diags.all()[0].code, "K0104");
  }
}

TEST(LibraryCheck, SyntaxFailureLandsInTheBag)
{
  Input input("(kicad_symbol_lib (version 1)");
  DiagnosticBag diags;
  EXPECT_FALSE(load_library(input.text, input.file, ParseStrategy::Borrowing, diags));
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags.all()[0].code, "K0001");
}

// ============================================================================
// Agreement
// ============================================================================

TEST(LibraryCheck, StrategiesAgreeOnAWellFormedLibrary)
{
  Input input(k_library);
  const SymbolLibraryFile lib = load_or_fail(input);
  for (const ParseStrategy used : {ParseStrategy::Owning, ParseStrategy::Borrowing}) {
    DiagnosticBag diags;
    EXPECT_TRUE(verify_agreement(input.text, input.file, used, lib, diags));
    EXPECT_TRUE(diags.empty());
  }
}

TEST(LibraryCheck, DisagreementPointsAtTheFirstDifferingSymbol)
{
  Input input(k_library);
  SymbolLibraryFile lib = load_or_fail(input);
  lib.symbols[1] = lib.symbols[0];

  DiagnosticBag diags;
  EXPECT_FALSE(verify_agreement(input.text, input.file, ParseStrategy::Owning, lib, diags));
  ASSERT_EQ(diags.size(), 1u);

  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.code, k_code_strategies_disagree);
  EXPECT_EQ(d.message, "parse strategies disagree");
  ASSERT_EQ(d.notes.size(), 1u);
  EXPECT_EQ(d.notes[0], "compared the owning and borrowing parsers");
  EXPECT_TRUE(d.help_message);

  const std::string second = "(symbol \"C\" (in_bom yes) (on_board yes))";
  const SourceRange range = d.primary_range();
  EXPECT_EQ(range.get_begin().offset(), input.text.find(second));
  EXPECT_EQ(range.size(), second.size());
}

TEST(LibraryCheck, HeaderDisagreementPointsAtTheLibrary)
{
  Input input(k_library);
  SymbolLibraryFile lib = load_or_fail(input);
  lib.generator = "eeschema";

  DiagnosticBag diags;
  EXPECT_FALSE(verify_agreement(input.text, input.file, ParseStrategy::Borrowing, lib, diags));
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags.all()[0].primary_range().get_begin().offset(), 0u);
  EXPECT_EQ(diags.all()[0].primary_range().size(), input.text.size());
  EXPECT_EQ(diags.all()[0].notes[0], "compared the borrowing and owning parsers");
}

// ============================================================================
// Round trip
// ============================================================================

TEST(LibraryCheck, RoundTripOfAnUnchangedModelPasses)
{
  Input input(k_library);
  DiagnosticBag diags;
  EXPECT_TRUE(verify_roundtrip(input.text, input.file, load_or_fail(input), diags));
  EXPECT_TRUE(diags.empty());
}

TEST(LibraryCheck, RoundTripMismatchPointsAtTheInnermostNode)
{
  Input input(k_library);
  SymbolLibraryFile lib = load_or_fail(input);
  lib.version = 20231120;

  DiagnosticBag diags;
  EXPECT_FALSE(verify_roundtrip(input.text, input.file, lib, diags));
  ASSERT_EQ(diags.size(), 1u);

  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.code, k_code_roundtrip_mismatch);
  ASSERT_EQ(d.labels.size(), 2u);
  // `20211014` inside `(version 20211014)`.
  EXPECT_EQ(d.labels[0].style, LabelStyle::Primary);
  EXPECT_EQ(d.labels[0].range, SourceRange(input.file, 27, 35));
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d.labels[1].range, SourceRange(input.file, 18, 36));

  const std::string text = render(diags, input.sources);
  EXPECT_NE(text.find("error[K0202]: serialized model differs from the input tree"),
            std::string::npos);
  EXPECT_NE(text.find(std::string(8, '^') + " written differently"), std::string::npos);
  EXPECT_NE(text.find(std::string(18, '-') + " in this item"), std::string::npos);
  EXPECT_NE(text.find("= help: run `kfmt format` to see the serialized form"), std::string::npos);
}

// ============================================================================
// Full check
// ============================================================================

TEST(LibraryCheck, CheckRunsEnabledVerifications)
{
  Input input(k_library);
  ToolConfig config;
  config.check.verify_agreement = true;
  config.check.verify_roundtrip = true;

  DiagnosticBag diags;
  const auto lib = check_library(input.text, input.file, config, diags);
  ASSERT_TRUE(lib);
  EXPECT_EQ(lib->symbols.size(), 2u);
  EXPECT_TRUE(diags.empty());
}

TEST(LibraryCheck, EmptyLibraryOnlyWarns)
{
  Input input("(kicad_symbol_lib (version 20211014) (generator kicad_symbol_editor))");
  DiagnosticBag diags;
  const auto lib = check_library(input.text, input.file, ToolConfig{}, diags);
  ASSERT_TRUE(lib);
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_FALSE(diags.has_errors());
  EXPECT_EQ(diags.all()[0].severity, Severity::Warning);
  EXPECT_EQ(diags.all()[0].code, k_code_empty_library);
  EXPECT_NE(render(diags, input.sources).find("warning[K0203]: library defines no symbols"),
            std::string::npos);
}

TEST(LibraryCheck, CheckStopsAtParseErrors)
{
  Input input("(kicad_symbol_lib (version 20211014.5) (generator x))");
  ToolConfig config;
  config.check.verify_roundtrip = true;

  DiagnosticBag diags;
  EXPECT_FALSE(check_library(input.text, input.file, config, diags));
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags.all()[0].code, "K0104");
}
