// kicad_format/project/tool_config.hpp - Tool configuration (kfmt.yaml)
//
// Parses and validates the kfmt.yaml file that sets parser and formatter
// defaults for the command-line tool.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kicad_format
{

// ============================================================================
// Configuration Structures
// ============================================================================

/// Which cursor the tool uses to build the typed model.
enum class ParseStrategy
{
  Owning,     ///< Parser over an owning Sexpr tree
  Borrowing,  ///< ParserRef over arena nodes
};

[[nodiscard]] std::string_view to_string(ParseStrategy strategy) noexcept;

/// Parse "owning" / "borrowing". Returns std::nullopt for anything else.
[[nodiscard]] std::optional<ParseStrategy> parse_strategy(std::string_view text) noexcept;

struct ParserConfig
{
  ParseStrategy strategy = ParseStrategy::Owning;
};

struct FormatConfig
{
  bool pretty = true;
  int indent = 2;
};

/**
 * Extra checks performed by `kfmt check`.
 */
struct CheckConfig
{
  /// Parse with both strategies and compare the models
  bool verify_agreement = true;

  /// Serialize the model and compare it with the input tree
  bool verify_roundtrip = false;
};

/**
 * Complete tool configuration (kfmt.yaml).
 */
struct ToolConfig
{
  ParserConfig parser;
  FormatConfig format;
  CheckConfig check;

  /// Directory containing kfmt.yaml; empty when defaults are in use
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  ToolConfig config;
  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ToolConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a tool configuration from a kfmt.yaml file.
 *
 * Missing keys keep their defaults. Unknown keys are ignored.
 *
 * @param config_path Path to kfmt.yaml
 * @return ConfigLoadResult with the loaded config or an error message
 */
[[nodiscard]] ConfigLoadResult load_tool_config(const std::filesystem::path & config_path);

/// Same as load_tool_config, reading YAML from a string (no config_root).
[[nodiscard]] ConfigLoadResult load_tool_config_from_string(std::string_view yaml_text);

/**
 * Search upward from start_dir for kfmt.yaml.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to kfmt.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_tool_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_tool_config_file_name = "kfmt.yaml";

}  // namespace kicad_format
