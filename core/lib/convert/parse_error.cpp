// kicad_format/convert/parse_error.cpp - Error messages and diagnostics
#include "kicad_format/convert/parse_error.hpp"

#include <fmt/format.h>

#include "kicad_format/sexpr/writer.hpp"

namespace kicad_format
{
namespace
{

// Limit how much of an offending token ends up in a one-line message.
constexpr size_t k_max_token_preview = 60;

std::string preview(const Sexpr & token)
{
  std::string text = write_sexpr(token, WriteOptions{false, 0});
  if (text.size() > k_max_token_preview) {
    text.resize(k_max_token_preview);
    text += "...";
  }
  return text;
}

struct MessageBuilder
{
  std::string operator()(const UnexpectedEndOfList &) const { return "unexpected end of list"; }

  std::string operator()(const UnexpectedTokenKind & d) const
  {
    if (d.found) {
      return fmt::format("expected {}, found {}", to_string(d.expected), to_string(*d.found));
    }
    return fmt::format("expected {}", to_string(d.expected));
  }

  std::string operator()(const NonMatchingSymbol & d) const
  {
    return fmt::format("expected symbol '{}', found '{}'", d.expected, d.found);
  }

  std::string operator()(const InvalidEnumValue & d) const
  {
    return fmt::format("invalid value '{}' for {}", d.value, d.enum_name);
  }

  std::string operator()(const ExpectedEndOfList & d) const
  {
    return fmt::format("expected end of list, found {}", preview(d.found));
  }

  std::string operator()(const LibraryIdentifierMalformed & d) const
  {
    return fmt::format("malformed library identifier '{}': {}", d.input, d.reason);
  }
};

}  // namespace

std::string_view to_string(ParseErrorKind kind) noexcept
{
  switch (kind) {
    case ParseErrorKind::UnexpectedEndOfList:
      return "UnexpectedEndOfList";
    case ParseErrorKind::UnexpectedTokenKind:
      return "UnexpectedTokenKind";
    case ParseErrorKind::NonMatchingSymbol:
      return "NonMatchingSymbol";
    case ParseErrorKind::InvalidEnumValue:
      return "InvalidEnumValue";
    case ParseErrorKind::ExpectedEndOfList:
      return "ExpectedEndOfList";
    case ParseErrorKind::LibraryIdentifierMalformed:
      return "LibraryIdentifierMalformed";
  }
  return "";
}

std::string_view error_code(ParseErrorKind kind) noexcept
{
  switch (kind) {
    case ParseErrorKind::UnexpectedEndOfList:
      return "K0101";
    case ParseErrorKind::UnexpectedTokenKind:
      return "K0102";
    case ParseErrorKind::NonMatchingSymbol:
      return "K0103";
    case ParseErrorKind::InvalidEnumValue:
      return "K0104";
    case ParseErrorKind::ExpectedEndOfList:
      return "K0105";
    case ParseErrorKind::LibraryIdentifierMalformed:
      return "K0106";
  }
  return "K0100";
}

// ============================================================================
// ParseError
// ============================================================================

ParseError::ParseError(ParseErrorDetail detail, std::optional<SourceRange> range)
: detail_(std::move(detail)), range_(range)
{
  refresh_what();
}

ParseError ParseError::unexpected_end_of_list() { return ParseError(UnexpectedEndOfList{}); }

ParseError ParseError::unexpected_token_kind(SexprKind expected, std::optional<SexprKind> found)
{
  return ParseError(UnexpectedTokenKind{expected, found});
}

ParseError ParseError::non_matching_symbol(std::string found, std::string expected)
{
  return ParseError(NonMatchingSymbol{std::move(found), std::move(expected)});
}

ParseError ParseError::invalid_enum_value(std::string value, std::string enum_name)
{
  return ParseError(InvalidEnumValue{std::move(value), std::move(enum_name)});
}

ParseError ParseError::expected_end_of_list(Sexpr found)
{
  return ParseError(ExpectedEndOfList{std::move(found)});
}

ParseError ParseError::library_identifier_malformed(std::string input, std::string reason)
{
  return ParseError(LibraryIdentifierMalformed{std::move(input), std::move(reason)});
}

void ParseError::push_context(std::string_view keyword)
{
  context_.emplace_back(keyword);
  refresh_what();
}

void ParseError::set_range_if_unset(SourceRange range)
{
  if (!range_ && range.is_valid()) {
    range_ = range;
  }
}

std::string ParseError::message() const { return std::visit(MessageBuilder{}, detail_); }

std::string ParseError::context_string() const
{
  std::string out;
  for (auto it = context_.rbegin(); it != context_.rend(); ++it) {
    if (!out.empty()) {
      out += " > ";
    }
    out += fmt::format("in '{}'", *it);
  }
  return out;
}

void ParseError::refresh_what()
{
  what_ = message();
  if (!context_.empty()) {
    what_ += " (" + context_string() + ")";
  }
}

// ============================================================================
// Diagnostics
// ============================================================================

Diagnostic to_diagnostic(const ParseError & error)
{
  Diagnostic diag;
  diag.severity = Severity::Error;
  diag.code = std::string(error_code(error.kind()));
  diag.message = error.message();
  diag.labels.push_back(Label{error.range().value_or(SourceRange{}), "", LabelStyle::Primary});
  if (!error.context().empty()) {
    diag.notes.push_back(error.context_string());
  }
  if (error.kind() == ParseErrorKind::LibraryIdentifierMalformed) {
    diag.help_message = "library identifiers have the form \"library:name\"";
  }
  return diag;
}

Diagnostic to_diagnostic(const SyntaxError & error)
{
  Diagnostic diag;
  diag.severity = Severity::Error;
  diag.code = "K0001";
  diag.message = error.message;
  diag.labels.push_back(Label{error.range, "", LabelStyle::Primary});
  return diag;
}

}  // namespace kicad_format
