// tests/integration/test_library_files.cpp - Whole `.kicad_sym` files on disk
//
// Loads the files under testdata/ through both parse strategies and checks
// that they agree, serialize back to the tree that was read, and survive a
// write/read cycle with either writer layout.
//
#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "kicad_format/basic/diagnostic_printer.hpp"
#include "kicad_format/model/json_export.hpp"
#include "kicad_format/model/symbol_library.hpp"
#include "kicad_format/project/tool_config.hpp"
#include "kicad_format/sexpr/writer.hpp"
#include "kicad_format/test_support/parse_helpers.hpp"

using namespace kicad_format;
using test_support::read_or_throw;
using test_support::read_text_file;

namespace
{

std::filesystem::path testdata(const char * name)
{
  return std::filesystem::path(KICAD_FORMAT_TESTDATA_DIR) / name;
}

class LibraryFileTest : public ::testing::TestWithParam<const char *>
{
protected:
  void SetUp() override { text_ = read_text_file(testdata(GetParam())); }

  std::string text_;
};

}  // namespace

// ============================================================================
// Every valid fixture
// ============================================================================

TEST_P(LibraryFileTest, StrategiesAgree)
{
  const LibraryLoadResult owned = parse_symbol_library(text_);
  const LibraryLoadResult borrowed = parse_symbol_library_fast(text_);
  ASSERT_TRUE(owned) << owned.error().message();
  ASSERT_TRUE(borrowed) << borrowed.error().message();
  EXPECT_EQ(owned.value(), borrowed.value());
}

TEST_P(LibraryFileTest, SerializesToTheTreeThatWasRead)
{
  const LibraryLoadResult lib = parse_symbol_library_fast(text_);
  ASSERT_TRUE(lib) << lib.error().message();
  EXPECT_EQ(lib->to_sexpr(), read_or_throw(text_));
}

TEST_P(LibraryFileTest, WrittenTextParsesToTheSameModel)
{
  const LibraryLoadResult lib = parse_symbol_library(text_);
  ASSERT_TRUE(lib) << lib.error().message();

  for (const bool pretty : {true, false}) {
    WriteOptions options;
    options.pretty = pretty;
    const std::string written = write_sexpr(lib->to_sexpr(), options);

    const LibraryLoadResult again = parse_symbol_library_fast(written);
    ASSERT_TRUE(again) << again.error().message();
    EXPECT_EQ(again.value(), lib.value()) << "pretty=" << pretty;
  }
}

TEST_P(LibraryFileTest, JsonExportListsEverySymbol)
{
  const LibraryLoadResult lib = parse_symbol_library(text_);
  ASSERT_TRUE(lib) << lib.error().message();
  const nlohmann::json j = to_json(lib.value());
  ASSERT_TRUE(j.contains("symbols"));
  EXPECT_EQ(j["symbols"].size(), lib->symbols.size());
}

INSTANTIATE_TEST_SUITE_P(
  Fixtures, LibraryFileTest, ::testing::Values("device_v6.kicad_sym", "mcu_v8.kicad_sym"));

// ============================================================================
// File specific content
// ============================================================================

TEST(LegacyLibraryFile, KeepsLegacySpellings)
{
  const LibraryLoadResult lib =
    parse_symbol_library(read_text_file(testdata("device_v6.kicad_sym")));
  ASSERT_TRUE(lib) << lib.error().message();

  EXPECT_EQ(lib->version, 20211014u);
  EXPECT_FALSE(lib->generator_is_string);
  ASSERT_EQ(lib->symbols.size(), 3u);

  const LibSymbol * r = lib->symbols[0].as_root();
  ASSERT_NE(r, nullptr);
  ASSERT_TRUE(r->pin_numbers.has_value());
  EXPECT_EQ(r->pin_numbers->hide, KeywordFlag::bare());
  ASSERT_EQ(r->properties.size(), 7u);
  EXPECT_EQ(r->properties[2].key.str(), "Footprint");
  EXPECT_EQ(r->properties[2].legacy_id, 2.0);
  EXPECT_EQ(r->properties[2].effects.hide, KeywordFlag::bare());
  ASSERT_EQ(r->units.size(), 2u);
  EXPECT_EQ(r->units[1].id.unit(), 1u);
  EXPECT_EQ(r->units[1].pins.size(), 2u);

  const DerivedLibSymbol * us = lib->symbols[1].as_derived();
  ASSERT_NE(us, nullptr);
  EXPECT_EQ(us->extends, "R");
  EXPECT_EQ(us->properties.size(), 3u);

  const LibSymbol * gnd = lib->symbols[2].as_root();
  ASSERT_NE(gnd, nullptr);
  EXPECT_TRUE(gnd->power);
  ASSERT_EQ(gnd->units.size(), 2u);
  ASSERT_EQ(gnd->units[0].graphics.size(), 2u);
  EXPECT_EQ(gnd->units[0].graphics[1].keyword(), "text");
  EXPECT_EQ(gnd->units[1].pins[0].hide, KeywordFlag::bare());
}

TEST(CurrentLibraryFile, KeepsCurrentSpellings)
{
  const LibraryLoadResult lib =
    parse_symbol_library_fast(read_text_file(testdata("mcu_v8.kicad_sym")));
  ASSERT_TRUE(lib) << lib.error().message();

  EXPECT_EQ(lib->version, 20231120u);
  EXPECT_TRUE(lib->generator_is_string);
  EXPECT_EQ(lib->generator_version, "8.0");
  ASSERT_EQ(lib->symbols.size(), 3u);

  const LibSymbol * amp = lib->symbols[0].as_root();
  ASSERT_NE(amp, nullptr);
  EXPECT_EQ(amp->exclude_from_sim, false);
  EXPECT_EQ(amp->embedded_fonts, false);
  EXPECT_TRUE(amp->properties[1].do_not_autoplace);
  EXPECT_TRUE(amp->properties[6].show_name);
  EXPECT_FALSE(amp->properties[6].legacy_id.has_value());
  EXPECT_EQ(amp->properties[2].effects.hide, KeywordFlag::named(true));
  ASSERT_EQ(amp->units.size(), 2u);
  EXPECT_EQ(amp->units[0].unit_name, "A");
  EXPECT_EQ(amp->units[1].id.unit(), 3u);
  ASSERT_EQ(amp->units[1].pins.size(), 2u);
  EXPECT_EQ(amp->units[1].pins[1].hide, KeywordFlag::named(false));

  ASSERT_TRUE(lib->symbols[1].is_derived());
  EXPECT_EQ(lib->symbols[1].as_derived()->extends, "LM358");

  const LibSymbol * mcu = lib->symbols[2].as_root();
  ASSERT_NE(mcu, nullptr);
  ASSERT_EQ(mcu->units.size(), 1u);
  EXPECT_EQ(mcu->units[0].id.name(), "STM32_PA0");
  EXPECT_EQ(mcu->units[0].graphics.size(), 4u);
  ASSERT_EQ(mcu->units[0].pins.size(), 1u);
  EXPECT_EQ(mcu->units[0].pins[0].alternates.size(), 2u);
}

// ============================================================================
// Invalid file
// ============================================================================

TEST(BrokenLibraryFile, BothStrategiesReportTheSameError)
{
  const std::string text = read_text_file(testdata("missing_in_bom.kicad_sym"));
  const LibraryLoadResult owned = parse_symbol_library(text);
  const LibraryLoadResult borrowed = parse_symbol_library_fast(text);
  ASSERT_FALSE(owned);
  ASSERT_FALSE(borrowed);
  EXPECT_FALSE(owned.error().is_syntax_error());
  EXPECT_EQ(owned.error().to_diagnostic().code, "K0103");
  EXPECT_EQ(borrowed.error().to_diagnostic().code, "K0103");
}

TEST(BrokenLibraryFile, DiagnosticPointsAtTheOffendingList)
{
  test_support::TestSourceUnit unit = test_support::make_source(
    read_text_file(testdata("missing_in_bom.kicad_sym")), "missing_in_bom.kicad_sym");

  const LibraryLoadResult result = parse_symbol_library_fast(unit.text(), unit.file_id);
  ASSERT_FALSE(result);
  const Diagnostic diag = result.error().to_diagnostic();

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(diag, unit.sources);
  const std::string rendered = out.str();

  EXPECT_NE(rendered.find("error[K0103]"), std::string::npos) << rendered;
  EXPECT_NE(rendered.find("missing_in_bom.kicad_sym:2:16"), std::string::npos) << rendered;
  EXPECT_NE(rendered.find("(symbol \"R\" (on_board yes)"), std::string::npos) << rendered;
}

// ============================================================================
// Configuration shipped beside the fixtures
// ============================================================================

TEST(FixtureConfig, FoundFromALibraryFileAndApplied)
{
  const auto found = find_tool_config(testdata("mcu_v8.kicad_sym"));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename().string(), k_tool_config_file_name);

  const ConfigLoadResult loaded = load_tool_config(*found);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.config.parser.strategy, ParseStrategy::Borrowing);
  EXPECT_TRUE(loaded.config.check.verify_roundtrip);

  const LibraryLoadResult lib =
    parse_symbol_library_fast(read_text_file(testdata("mcu_v8.kicad_sym")));
  ASSERT_TRUE(lib) << lib.error().message();

  WriteOptions options;
  options.pretty = loaded.config.format.pretty;
  options.indent = loaded.config.format.indent;
  const std::string written = write_sexpr(lib->to_sexpr(), options);
  EXPECT_EQ(read_or_throw(written), lib->to_sexpr());
}
