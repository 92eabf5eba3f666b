// tests/unit/project/test_tool_config.cpp - kfmt.yaml loading
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "kicad_format/project/tool_config.hpp"

using namespace kicad_format;
namespace fs = std::filesystem;

namespace
{

/// A scratch directory removed when the test ends.
class TempDir
{
public:
  TempDir()
  {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() / ("kfmt_config_test_" + std::to_string(stamp));
    fs::create_directories(path_);
  }

  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const fs::path & path() const { return path_; }

  fs::path write(const fs::path & relative, const std::string & content) const
  {
    const fs::path full = path_ / relative;
    fs::create_directories(full.parent_path());
    std::ofstream(full) << content;
    return full;
  }

private:
  fs::path path_;
};

}  // namespace

TEST(ToolConfig, DefaultsWhenEmpty)
{
  const auto result = load_tool_config_from_string("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.parser.strategy, ParseStrategy::Owning);
  EXPECT_TRUE(result.config.format.pretty);
  EXPECT_EQ(result.config.format.indent, 2);
  EXPECT_TRUE(result.config.check.verify_agreement);
  EXPECT_FALSE(result.config.check.verify_roundtrip);
}

TEST(ToolConfig, LoadsAllSections)
{
  const auto result = load_tool_config_from_string(
    "parser:\n"
    "  strategy: borrowing\n"
    "format:\n"
    "  pretty: false\n"
    "  indent: 4\n"
    "check:\n"
    "  verify_agreement: false\n"
    "  verify_roundtrip: true\n");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.parser.strategy, ParseStrategy::Borrowing);
  EXPECT_FALSE(result.config.format.pretty);
  EXPECT_EQ(result.config.format.indent, 4);
  EXPECT_FALSE(result.config.check.verify_agreement);
  EXPECT_TRUE(result.config.check.verify_roundtrip);
}

TEST(ToolConfig, RejectsInvalidStrategy)
{
  const auto result = load_tool_config_from_string("parser:\n  strategy: lazy\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid parser.strategy: 'lazy'"), std::string::npos);
}

TEST(ToolConfig, RejectsBadValues)
{
  EXPECT_FALSE(load_tool_config_from_string("format:\n  indent: many\n").success);
  EXPECT_FALSE(load_tool_config_from_string("format:\n  indent: 100\n").success);
  EXPECT_FALSE(load_tool_config_from_string("check:\n  verify_roundtrip: [1, 2]\n").success);
  EXPECT_FALSE(load_tool_config_from_string("- just\n- a list\n").success);
  EXPECT_FALSE(load_tool_config_from_string("parser: {strategy: [\n").success);
}

TEST(ToolConfig, StrategyNames)
{
  EXPECT_EQ(parse_strategy("owning"), ParseStrategy::Owning);
  EXPECT_EQ(parse_strategy("borrowing"), ParseStrategy::Borrowing);
  EXPECT_FALSE(parse_strategy("Owning").has_value());
  EXPECT_EQ(to_string(ParseStrategy::Borrowing), "borrowing");
}

TEST(ToolConfig, LoadsFromFileAndRecordsRoot)
{
  TempDir dir;
  const fs::path file = dir.write("kfmt.yaml", "format:\n  indent: 3\n");

  const auto result = load_tool_config(file);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.format.indent, 3);
  EXPECT_EQ(fs::canonical(result.config.config_root), fs::canonical(dir.path()));
}

TEST(ToolConfig, MissingFile)
{
  TempDir dir;
  const auto result = load_tool_config(dir.path() / "kfmt.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(ToolConfig, FindsConfigInParentDirectory)
{
  TempDir dir;
  const fs::path config = dir.write("kfmt.yaml", "parser:\n  strategy: owning\n");
  const fs::path nested = dir.write("libs/power/Power.kicad_sym", "(kicad_symbol_lib)");

  const auto from_file = find_tool_config(nested);
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::canonical(*from_file), fs::canonical(config));

  const auto from_dir = find_tool_config(nested.parent_path());
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(fs::canonical(*from_dir), fs::canonical(config));
}
