// kicad_format/model/symbol_library.hpp - Symbol library files (`.kicad_sym`)
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "kicad_format/basic/source_manager.hpp"
#include "kicad_format/convert/parse_error.hpp"
#include "kicad_format/model/symbol.hpp"

namespace kicad_format
{

/**
 * `(kicad_symbol_lib (version N) (generator g) (generator_version "X")? symbol*)`
 *
 * Older files write the generator as a bare symbol, newer ones as a quoted
 * string; generator_is_string records which one was read.
 */
struct SymbolLibraryFile
{
  static constexpr std::string_view k_keyword = "kicad_symbol_lib";

  /// File format version in YYYYMMDD form.
  uint32_t version = 0;
  std::string generator;
  bool generator_is_string = false;
  std::optional<std::string> generator_version;
  std::vector<SymbolDefinition> symbols;

  static SymbolLibraryFile from_sexpr(Parser parser);
  static SymbolLibraryFile from_sexpr_ref(ParserRef parser);
  static bool is_present(const SexprList & list) { return list_has_name(list, k_keyword); }
  static bool is_present_ref(const ListNode & list) { return list.has_name(k_keyword); }
  [[nodiscard]] Sexpr to_sexpr() const;

  bool operator==(const SymbolLibraryFile & o) const
  {
    return version == o.version && generator == o.generator &&
           generator_is_string == o.generator_is_string &&
           generator_version == o.generator_version && symbols == o.symbols;
  }
  bool operator!=(const SymbolLibraryFile & o) const { return !(*this == o); }
};

// ============================================================================
// Entry points
// ============================================================================

/// Failure of a text entry point: either unreadable text or an invalid document.
struct LibraryLoadError
{
  std::variant<SyntaxError, ParseError> error;

  [[nodiscard]] bool is_syntax_error() const noexcept { return error.index() == 0; }
  [[nodiscard]] std::string message() const;
  [[nodiscard]] Diagnostic to_diagnostic() const;
};

using LibraryLoadResult = Result<SymbolLibraryFile, LibraryLoadError>;

/// Owning parse of an already-read tree.
[[nodiscard]] ParseResult<SymbolLibraryFile> parse_symbol_library(const Sexpr & tree);

/// Read `text` into an owning tree and parse it.
[[nodiscard]] LibraryLoadResult parse_symbol_library(
  std::string_view text, FileId file = FileId::invalid());

/// Borrowing parse of a node owned by a live SexprContext.
[[nodiscard]] ParseResult<SymbolLibraryFile> parse_symbol_library_fast(const SexprNode & root);

/// Read `text` into a temporary arena and parse it without copying tokens.
[[nodiscard]] LibraryLoadResult parse_symbol_library_fast(
  std::string_view text, FileId file = FileId::invalid());

}  // namespace kicad_format
