// kicad_format/convert/parse_error.hpp - Error taxonomy for model conversion
//
// Cursors throw ParseError. Every public entry point catches it and returns a
// ParseResult, so callers never see an exception escape the library.
//
#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "kicad_format/basic/diagnostic.hpp"
#include "kicad_format/basic/result.hpp"
#include "kicad_format/basic/source_manager.hpp"
#include "kicad_format/sexpr/reader.hpp"
#include "kicad_format/sexpr/sexpr.hpp"

namespace kicad_format
{

// ============================================================================
// Error details
// ============================================================================

/// A cursor ran out of tokens while more were required.
struct UnexpectedEndOfList
{
  bool operator==(const UnexpectedEndOfList &) const { return true; }
};

/// The next token had the wrong kind.
struct UnexpectedTokenKind
{
  SexprKind expected = SexprKind::List;
  std::optional<SexprKind> found;

  bool operator==(const UnexpectedTokenKind & o) const
  {
    return expected == o.expected && found == o.found;
  }
};

/// A symbol did not have the required spelling.
struct NonMatchingSymbol
{
  std::string found;
  std::string expected;

  bool operator==(const NonMatchingSymbol & o) const
  {
    return found == o.found && expected == o.expected;
  }
};

/// A symbol is not part of an enumeration's vocabulary.
struct InvalidEnumValue
{
  std::string value;
  std::string enum_name;

  bool operator==(const InvalidEnumValue & o) const
  {
    return value == o.value && enum_name == o.enum_name;
  }
};

/// A list had trailing tokens. `found` is the first unconsumed one.
struct ExpectedEndOfList
{
  Sexpr found;

  bool operator==(const ExpectedEndOfList & o) const { return found == o.found; }
};

/// A `library:name` or `name_unit_style` identifier failed its structural check.
struct LibraryIdentifierMalformed
{
  std::string input;
  std::string reason;

  bool operator==(const LibraryIdentifierMalformed & o) const
  {
    return input == o.input && reason == o.reason;
  }
};

// Alternative order matches ParseErrorKind.
using ParseErrorDetail = std::variant<
  UnexpectedEndOfList, UnexpectedTokenKind, NonMatchingSymbol, InvalidEnumValue,
  ExpectedEndOfList, LibraryIdentifierMalformed>;

enum class ParseErrorKind : uint8_t {
  UnexpectedEndOfList,
  UnexpectedTokenKind,
  NonMatchingSymbol,
  InvalidEnumValue,
  ExpectedEndOfList,
  LibraryIdentifierMalformed,
};

[[nodiscard]] std::string_view to_string(ParseErrorKind kind) noexcept;

/// Stable diagnostic code, e.g. "K0103" for NonMatchingSymbol.
[[nodiscard]] std::string_view error_code(ParseErrorKind kind) noexcept;

// ============================================================================
// ParseError
// ============================================================================

/**
 * A conversion failure. Terminal for the whole document.
 *
 * Besides its detail, an error carries the chain of entity keywords it
 * passed through on its way out (innermost first) and, on the borrowing
 * path, the source range of the offending node.
 */
class ParseError : public std::exception
{
public:
  explicit ParseError(ParseErrorDetail detail, std::optional<SourceRange> range = std::nullopt);

  [[nodiscard]] static ParseError unexpected_end_of_list();
  [[nodiscard]] static ParseError unexpected_token_kind(
    SexprKind expected, std::optional<SexprKind> found = std::nullopt);
  [[nodiscard]] static ParseError non_matching_symbol(std::string found, std::string expected);
  [[nodiscard]] static ParseError invalid_enum_value(std::string value, std::string enum_name);
  [[nodiscard]] static ParseError expected_end_of_list(Sexpr found);
  [[nodiscard]] static ParseError library_identifier_malformed(
    std::string input, std::string reason);

  [[nodiscard]] ParseErrorKind kind() const noexcept
  {
    return static_cast<ParseErrorKind>(detail_.index());
  }

  [[nodiscard]] const ParseErrorDetail & detail() const noexcept { return detail_; }

  /// The detail as T, or nullptr when the error is of another kind.
  template <typename T>
  [[nodiscard]] const T * detail_if() const noexcept
  {
    return std::get_if<T>(&detail_);
  }

  /// Entity keywords the error propagated through, innermost first.
  [[nodiscard]] const std::vector<std::string> & context() const noexcept { return context_; }

  /// Record that the error left the entity named `keyword`.
  void push_context(std::string_view keyword);

  [[nodiscard]] const std::optional<SourceRange> & range() const noexcept { return range_; }

  /// Attach a source range unless one is already known.
  void set_range_if_unset(SourceRange range);

  /// Message built from the detail alone, e.g. "expected symbol 'in_bom', found 'on_board'".
  [[nodiscard]] std::string message() const;

  /// Outermost-first context, e.g. "in 'kicad_symbol_lib' > in 'symbol'".
  [[nodiscard]] std::string context_string() const;

  /// message() followed by the context chain.
  [[nodiscard]] const char * what() const noexcept override { return what_.c_str(); }

  [[nodiscard]] bool operator==(const ParseError & other) const
  {
    return detail_ == other.detail_ && context_ == other.context_;
  }

private:
  void refresh_what();

  ParseErrorDetail detail_;
  std::vector<std::string> context_;
  std::optional<SourceRange> range_;
  std::string what_;
};

template <typename T>
using ParseResult = Result<T, ParseError>;

// ============================================================================
// Diagnostics
// ============================================================================

[[nodiscard]] Diagnostic to_diagnostic(const ParseError & error);
[[nodiscard]] Diagnostic to_diagnostic(const SyntaxError & error);

}  // namespace kicad_format
