// kicad_format/sexpr/token.hpp - Token kinds produced by the lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "kicad_format/basic/source_manager.hpp"

namespace kicad_format::sexpr
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,  // e.g. an unterminated string

  LParen,
  RParen,

  Symbol,  // bare atom that is not a number
  String,  // token.text is the raw string *contents* (without quotes, escapes kept)
  Number,  // bare atom that fully parses as a decimal floating point value
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes for strings)
  std::string_view text;  // slice view (for String: interior)
  bool has_escapes = false;

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::Symbol:
      return "symbol";
    case TokenKind::String:
      return "string";
    case TokenKind::Number:
      return "number";
  }
  return "";
}

}  // namespace kicad_format::sexpr
