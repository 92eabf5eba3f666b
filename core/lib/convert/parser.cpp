// kicad_format/convert/parser.cpp - Owning token cursor
#include "kicad_format/convert/parser.hpp"

#include "kicad_format/sexpr/writer.hpp"

namespace kicad_format
{

Parser::Parser(SexprList list) : list_(std::make_shared<const SexprList>(std::move(list))) {}

Parser::Parser(std::shared_ptr<const SexprList> list) : list_(std::move(list)) {}

Parser Parser::from_tree(const Sexpr & tree)
{
  const SexprList * items = tree.as_list();
  if (items == nullptr) {
    throw ParseError::unexpected_token_kind(SexprKind::List, tree.kind());
  }
  return Parser(*items);
}

const Sexpr * Parser::peek() const noexcept
{
  return at_end() ? nullptr : &(*list_)[pos_];
}

const Sexpr * Parser::peek_second() const noexcept
{
  return pos_ + 1 < list_->size() ? &(*list_)[pos_ + 1] : nullptr;
}

const Sexpr & Parser::consume()
{
  if (at_end()) {
    throw ParseError::unexpected_end_of_list();
  }
  return (*list_)[pos_++];
}

Sexpr Parser::next() { return consume(); }

Parser Parser::expect_list()
{
  const Sexpr * token = peek();
  if (token == nullptr) {
    throw ParseError::unexpected_end_of_list();
  }
  const SexprList * items = token->as_list();
  if (items == nullptr) {
    throw ParseError::unexpected_token_kind(SexprKind::List, token->kind());
  }
  ++pos_;
  // Aliasing constructor: shares ownership of the root, points at the child.
  return Parser(std::shared_ptr<const SexprList>(list_, items));
}

Parser Parser::expect_list_with_name(std::string_view keyword)
{
  Parser child = expect_list();
  child.expect_symbol_matching(keyword);
  return child;
}

std::optional<Parser> Parser::maybe_list_with_name(std::string_view keyword)
{
  const Sexpr * token = peek();
  if (token == nullptr || !token->is_list_with_name(keyword)) {
    return std::nullopt;
  }
  Parser child = expect_list();
  child.pos_ = 1;
  return child;
}

std::string Parser::expect_symbol()
{
  const Sexpr & token = consume();
  if (const std::string * s = token.as_symbol()) {
    return *s;
  }
  throw ParseError::unexpected_token_kind(SexprKind::Symbol, token.kind());
}

std::string Parser::expect_string()
{
  const Sexpr & token = consume();
  if (const std::string * s = token.as_string()) {
    return *s;
  }
  throw ParseError::unexpected_token_kind(SexprKind::String, token.kind());
}

double Parser::expect_number()
{
  const Sexpr & token = consume();
  if (const double * n = token.as_number()) {
    return *n;
  }
  throw ParseError::unexpected_token_kind(SexprKind::Number, token.kind());
}

void Parser::expect_symbol_matching(std::string_view value)
{
  std::string found = expect_symbol();
  if (found != value) {
    throw ParseError::non_matching_symbol(std::move(found), std::string(value));
  }
}

bool Parser::expect_bool_with_name(std::string_view keyword, BoolSpelling * spelling)
{
  Parser child = expect_list_with_name(keyword);
  std::string s = child.expect_symbol();
  bool value = false;
  BoolSpelling words = BoolSpelling::YesNo;
  if (!parse_bool_symbol(s, value, words)) {
    throw ParseError::invalid_enum_value(std::move(s), "bool");
  }
  child.expect_end();
  if (spelling != nullptr) {
    *spelling = words;
  }
  return value;
}

void Parser::expect_end()
{
  if (const Sexpr * token = peek()) {
    throw ParseError::expected_end_of_list(*token);
  }
}

std::string Parser::expect_string_with_name(std::string_view keyword)
{
  Parser child = expect_list_with_name(keyword);
  std::string value = child.expect_string();
  child.expect_end();
  return value;
}

std::optional<std::string> Parser::maybe_string_with_name(std::string_view keyword)
{
  auto child = maybe_list_with_name(keyword);
  if (!child) {
    return std::nullopt;
  }
  std::string value = child->expect_string();
  child->expect_end();
  return value;
}

double Parser::expect_number_with_name(std::string_view keyword)
{
  Parser child = expect_list_with_name(keyword);
  const double value = child.expect_number();
  child.expect_end();
  return value;
}

uint32_t Parser::expect_unsigned_with_name(std::string_view keyword)
{
  Parser child = expect_list_with_name(keyword);
  const double value = child.expect_number();
  uint32_t out = 0;
  if (!number_to_u32(value, out)) {
    throw ParseError::invalid_enum_value(format_number(value), std::string(keyword));
  }
  child.expect_end();
  return out;
}

std::optional<double> Parser::maybe_number_with_name(std::string_view keyword)
{
  auto child = maybe_list_with_name(keyword);
  if (!child) {
    return std::nullopt;
  }
  const double value = child->expect_number();
  child->expect_end();
  return value;
}

std::string Parser::expect_symbol_with_name(std::string_view keyword)
{
  Parser child = expect_list_with_name(keyword);
  std::string value = child.expect_symbol();
  child.expect_end();
  return value;
}

std::optional<bool> Parser::maybe_bool_with_name(
  std::string_view keyword, BoolSpelling * spelling)
{
  const Sexpr * token = peek();
  if (token == nullptr || !token->is_list_with_name(keyword)) {
    return std::nullopt;
  }
  return expect_bool_with_name(keyword, spelling);
}

std::optional<double> Parser::maybe_number()
{
  const Sexpr * token = peek();
  if (token == nullptr || !token->is_number()) {
    return std::nullopt;
  }
  ++pos_;
  return *token->as_number();
}

bool Parser::maybe_symbol_matching(std::string_view value)
{
  const Sexpr * token = peek();
  if (token == nullptr) {
    return false;
  }
  const std::string * s = token->as_symbol();
  if (s == nullptr || *s != value) {
    return false;
  }
  ++pos_;
  return true;
}

bool Parser::maybe_empty_list_with_name(std::string_view keyword)
{
  auto child = maybe_list_with_name(keyword);
  if (!child) {
    return false;
  }
  child->expect_end();
  return true;
}

KeywordFlag Parser::maybe_keyword_flag(std::string_view keyword)
{
  if (maybe_symbol_matching(keyword)) {
    return KeywordFlag::bare();
  }
  BoolSpelling words = BoolSpelling::YesNo;
  if (auto value = maybe_bool_with_name(keyword, &words)) {
    return KeywordFlag::named(*value, words);
  }
  return KeywordFlag::omitted();
}

}  // namespace kicad_format
