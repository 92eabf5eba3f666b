// kicad_format/sexpr/lexer.hpp - Tokenizer for KiCad S-expression text
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kicad_format/sexpr/token.hpp"

namespace kicad_format::sexpr
{

class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  /// Tokenize the whole input. The last token is always Eof.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();

  [[nodiscard]] Token lex_atom();
  [[nodiscard]] Token lex_string();

  [[nodiscard]] SourceRange make_range(uint32_t start, uint32_t end) const noexcept
  {
    return {file_id_, start, end};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

/// Parse a bare atom as a number. Returns nullopt when the atom is a symbol.
[[nodiscard]] std::optional<double> parse_number_atom(std::string_view text) noexcept;

/// Resolve `\" \\ \n \r \t` escapes in raw string contents.
[[nodiscard]] std::string unescape_string(std::string_view raw);

}  // namespace kicad_format::sexpr
