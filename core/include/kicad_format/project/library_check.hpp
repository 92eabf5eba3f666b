// kicad_format/project/library_check.hpp - Library checks run by kfmt
//
// Every failure is reported into a DiagnosticBag so the tool can print
// all of them together with DiagnosticPrinter::print_all.
//
#pragma once

#include <optional>
#include <string_view>

#include "kicad_format/basic/diagnostic.hpp"
#include "kicad_format/basic/source_manager.hpp"
#include "kicad_format/model/symbol_library.hpp"
#include "kicad_format/project/tool_config.hpp"

namespace kicad_format
{

/// Codes for failures found after a successful parse.
inline constexpr const char * k_code_strategies_disagree = "K0201";
inline constexpr const char * k_code_roundtrip_mismatch = "K0202";
inline constexpr const char * k_code_empty_library = "K0203";

/// Parse `text` with one strategy. Syntax and parse errors go to `diags`.
[[nodiscard]] std::optional<SymbolLibraryFile> load_library(
  std::string_view text, FileId file, ParseStrategy strategy, DiagnosticBag & diags);

/**
 * Parse again with the strategy other than `used` and compare the result
 * with `lib`.
 *
 * A rejection by the other strategy is reported with its own parse error.
 * A different model is reported at the first symbol that differs.
 *
 * @return true when both strategies produced the same model
 */
bool verify_agreement(
  std::string_view text, FileId file, ParseStrategy used, const SymbolLibraryFile & lib,
  DiagnosticBag & diags);

/// Serialize `lib` and compare it with the tree read from `text`.
bool verify_roundtrip(
  std::string_view text, FileId file, const SymbolLibraryFile & lib, DiagnosticBag & diags);

/**
 * Everything `kfmt check` does: parse with the configured strategy, then run
 * the checks `config.check` enables. An empty library only warns.
 *
 * @return The model, or std::nullopt when any error was reported
 */
[[nodiscard]] std::optional<SymbolLibraryFile> check_library(
  std::string_view text, FileId file, const ToolConfig & config, DiagnosticBag & diags);

}  // namespace kicad_format
