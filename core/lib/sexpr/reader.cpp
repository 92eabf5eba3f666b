// kicad_format/sexpr/reader.cpp - Recursive descent over lexer tokens
#include "kicad_format/sexpr/reader.hpp"

#include <optional>
#include <vector>

#include "kicad_format/sexpr/lexer.hpp"

namespace kicad_format
{
namespace
{

using sexpr::Token;
using sexpr::TokenKind;

class TreeReader
{
public:
  explicit TreeReader(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  ReadResult read_document()
  {
    if (peek().kind == TokenKind::Eof) {
      return SyntaxError{"expected an expression, found end of input", peek().range};
    }

    std::optional<Sexpr> root = read_expr();
    if (!root) {
      return std::move(*error_);
    }
    if (peek().kind != TokenKind::Eof) {
      return SyntaxError{"unexpected input after the root expression", peek().range};
    }
    return std::move(*root);
  }

private:
  [[nodiscard]] const Token & peek() const noexcept { return tokens_[pos_]; }

  std::optional<Sexpr> fail(std::string message, SourceRange range)
  {
    error_ = SyntaxError{std::move(message), range};
    return std::nullopt;
  }

  std::optional<Sexpr> read_expr()
  {
    const Token & tok = tokens_[pos_];
    switch (tok.kind) {
      case TokenKind::LParen:
        return read_list();
      case TokenKind::RParen:
        return fail("unexpected ')'", tok.range);
      case TokenKind::Symbol:
        ++pos_;
        return Sexpr::symbol(std::string(tok.text));
      case TokenKind::String:
        ++pos_;
        return Sexpr::string(
          tok.has_escapes ? sexpr::unescape_string(tok.text) : std::string(tok.text));
      case TokenKind::Number:
        ++pos_;
        return Sexpr::number(sexpr::parse_number_atom(tok.text).value_or(0.0));
      case TokenKind::Unknown:
        return fail("unterminated string", tok.range);
      case TokenKind::Eof:
        return fail("unexpected end of input", tok.range);
    }
    return fail("unexpected token", tok.range);
  }

  std::optional<Sexpr> read_list()
  {
    const SourceRange open = tokens_[pos_].range;
    ++pos_;

    SexprList items;
    while (peek().kind != TokenKind::RParen) {
      if (peek().kind == TokenKind::Eof) {
        return fail("unclosed '('", open);
      }
      std::optional<Sexpr> item = read_expr();
      if (!item) {
        return std::nullopt;
      }
      items.push_back(std::move(*item));
    }
    ++pos_;
    return Sexpr::list(std::move(items));
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  std::optional<SyntaxError> error_;
};

}  // namespace

ReadResult read_sexpr(std::string_view text, FileId file)
{
  sexpr::Lexer lexer(file, text);
  TreeReader reader(lexer.lex_all());
  return reader.read_document();
}

}  // namespace kicad_format
