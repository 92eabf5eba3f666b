// kicad_format/project/tool_config.cpp - Tool configuration implementation
//
#include "kicad_format/project/tool_config.hpp"

#include <yaml-cpp/yaml.h>

namespace kicad_format
{

std::string_view to_string(ParseStrategy strategy) noexcept
{
  switch (strategy) {
    case ParseStrategy::Owning:
      return "owning";
    case ParseStrategy::Borrowing:
      return "borrowing";
  }
  return "owning";
}

std::optional<ParseStrategy> parse_strategy(std::string_view text) noexcept
{
  if (text == "owning") return ParseStrategy::Owning;
  if (text == "borrowing") return ParseStrategy::Borrowing;
  return std::nullopt;
}

namespace
{

/// Read a scalar into `out`, reporting the dotted key on a type mismatch.
template <typename T>
bool read_scalar(const YAML::Node & node, const char * key, T & out, std::string & error)
{
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    error = std::string(key) + " must be a scalar";
    return false;
  }
  try {
    out = node.as<T>();
  } catch (const YAML::Exception & e) {
    error = std::string("invalid value for ") + key + ": " + e.what();
    return false;
  }
  return true;
}

ConfigLoadResult build_config(const YAML::Node & root)
{
  ToolConfig config;
  std::string error;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'parser' section
  if (const auto parser = root["parser"]) {
    std::string strategy;
    if (!read_scalar(parser["strategy"], "parser.strategy", strategy, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (!strategy.empty()) {
      const auto parsed = parse_strategy(strategy);
      if (!parsed) {
        return ConfigLoadResult::fail(
          "invalid parser.strategy: '" + strategy + "' (must be 'owning' or 'borrowing')");
      }
      config.parser.strategy = *parsed;
    }
  }

  // Parse 'format' section
  if (const auto format = root["format"]) {
    if (
      !read_scalar(format["pretty"], "format.pretty", config.format.pretty, error) ||
      !read_scalar(format["indent"], "format.indent", config.format.indent, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (config.format.indent < 0 || config.format.indent > 16) {
      return ConfigLoadResult::fail("format.indent must be between 0 and 16");
    }
  }

  // Parse 'check' section
  if (const auto check = root["check"]) {
    if (
      !read_scalar(
        check["verify_agreement"], "check.verify_agreement", config.check.verify_agreement,
        error) ||
      !read_scalar(
        check["verify_roundtrip"], "check.verify_roundtrip", config.check.verify_roundtrip,
        error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_tool_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  auto result = build_config(root);
  if (result.success) {
    result.config.config_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

ConfigLoadResult load_tool_config_from_string(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return build_config(root);
}

std::optional<std::filesystem::path> find_tool_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_tool_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace kicad_format
