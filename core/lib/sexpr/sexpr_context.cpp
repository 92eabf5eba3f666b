// kicad_format/sexpr/sexpr_context.cpp - Borrowed tree construction
#include "kicad_format/sexpr/sexpr_context.hpp"

#include <optional>

#include "kicad_format/sexpr/lexer.hpp"

namespace kicad_format
{
namespace
{

using sexpr::Token;
using sexpr::TokenKind;

class NodeBuilder
{
public:
  NodeBuilder(SexprContext & ctx, std::vector<Token> tokens)
  : ctx_(ctx), tokens_(std::move(tokens))
  {
  }

  NodeReadResult build()
  {
    if (peek().kind == TokenKind::Eof) {
      return SyntaxError{"expected an expression, found end of input", peek().range};
    }
    const SexprNode * root = build_expr();
    if (root == nullptr) {
      return std::move(*error_);
    }
    if (peek().kind != TokenKind::Eof) {
      return SyntaxError{"unexpected input after the root expression", peek().range};
    }
    return root;
  }

private:
  [[nodiscard]] const Token & peek() const noexcept { return tokens_[pos_]; }

  const SexprNode * fail(std::string message, SourceRange range)
  {
    error_ = SyntaxError{std::move(message), range};
    return nullptr;
  }

  const SexprNode * build_expr()
  {
    const Token & tok = tokens_[pos_];
    switch (tok.kind) {
      case TokenKind::LParen:
        return build_list();
      case TokenKind::RParen:
        return fail("unexpected ')'", tok.range);
      case TokenKind::Symbol:
        ++pos_;
        return ctx_.create<SymbolNode>(tok.text, tok.range);
      case TokenKind::String:
        ++pos_;
        // Plain strings view the arena copy of the source directly.
        if (!tok.has_escapes) {
          return ctx_.create<StringNode>(tok.text, tok.range);
        }
        return ctx_.create<StringNode>(
          ctx_.copy_string(sexpr::unescape_string(tok.text)), tok.range);
      case TokenKind::Number:
        ++pos_;
        return ctx_.create<NumberNode>(
          sexpr::parse_number_atom(tok.text).value_or(0.0), tok.range);
      case TokenKind::Unknown:
        return fail("unterminated string", tok.range);
      case TokenKind::Eof:
        return fail("unexpected end of input", tok.range);
    }
    return fail("unexpected token", tok.range);
  }

  const SexprNode * build_list()
  {
    const SourceRange open = tokens_[pos_].range;
    ++pos_;

    std::vector<const SexprNode *> children;
    while (peek().kind != TokenKind::RParen) {
      if (peek().kind == TokenKind::Eof) {
        return fail("unclosed '('", open);
      }
      const SexprNode * child = build_expr();
      if (child == nullptr) {
        return nullptr;
      }
      children.push_back(child);
    }
    const SourceRange close = peek().range;
    ++pos_;

    const SourceRange range(open.file_id(), open.get_begin().offset(), close.get_end().offset());
    return ctx_.create<ListNode>(ctx_.copy_to_arena(children), range);
  }

  SexprContext & ctx_;
  std::vector<Token> tokens_;
  size_t pos_ = 0;
  std::optional<SyntaxError> error_;
};

}  // namespace

NodeReadResult SexprContext::read(std::string_view text, FileId file)
{
  source_ = copy_string(text);
  sexpr::Lexer lexer(file, source_);
  NodeBuilder builder(*this, lexer.lex_all());
  return builder.build();
}

Sexpr materialize(const SexprNode & node)
{
  if (const auto * sym = dyn_cast<SymbolNode>(&node)) {
    return Sexpr::symbol(std::string(sym->text));
  }
  if (const auto * str = dyn_cast<StringNode>(&node)) {
    return Sexpr::string(std::string(str->text));
  }
  if (const auto * num = dyn_cast<NumberNode>(&node)) {
    return Sexpr::number(num->value);
  }

  const auto & list = cast<ListNode>(&node)->children;
  SexprList items;
  items.reserve(list.size());
  for (const SexprNode * child : list) {
    items.push_back(materialize(*child));
  }
  return Sexpr::list(std::move(items));
}

}  // namespace kicad_format
