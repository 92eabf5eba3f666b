// kicad_format/convert/parser_ref.cpp - Borrowing token cursor
#include "kicad_format/convert/parser_ref.hpp"

#include "kicad_format/sexpr/writer.hpp"

namespace kicad_format
{

void ParserRef::fail(ParseError error, const SexprNode * at) const
{
  if (at != nullptr) {
    error.set_range_if_unset(at->range);
  } else if (range_.is_valid()) {
    // Point at the closing parenthesis.
    const uint32_t end = range_.get_end().offset();
    error.set_range_if_unset(SourceRange(range_.file_id(), end > 0 ? end - 1 : 0, end));
  }
  throw error;
}

const SexprNode & ParserRef::consume()
{
  if (at_end()) {
    fail(ParseError::unexpected_end_of_list(), nullptr);
  }
  return *children_[pos_++];
}

const SexprNode & ParserRef::next() { return consume(); }

ParserRef ParserRef::expect_list()
{
  const SexprNode * token = peek();
  if (token == nullptr) {
    fail(ParseError::unexpected_end_of_list(), nullptr);
  }
  const auto * list = dyn_cast<ListNode>(token);
  if (list == nullptr) {
    fail(ParseError::unexpected_token_kind(SexprKind::List, token->kind), token);
  }
  ++pos_;
  return ParserRef(*list);
}

ParserRef ParserRef::expect_list_with_name(std::string_view keyword)
{
  ParserRef child = expect_list();
  child.expect_symbol_matching(keyword);
  return child;
}

std::optional<ParserRef> ParserRef::maybe_list_with_name(std::string_view keyword)
{
  const auto * list = dyn_cast<ListNode>(peek());
  if (list == nullptr || !list->has_name(keyword)) {
    return std::nullopt;
  }
  ++pos_;
  return ParserRef(list->children, list->range, 1);
}

std::string_view ParserRef::expect_symbol()
{
  const SexprNode & token = consume();
  if (const auto * sym = dyn_cast<SymbolNode>(&token)) {
    return sym->text;
  }
  fail(ParseError::unexpected_token_kind(SexprKind::Symbol, token.kind), &token);
}

std::string_view ParserRef::expect_string()
{
  const SexprNode & token = consume();
  if (const auto * str = dyn_cast<StringNode>(&token)) {
    return str->text;
  }
  fail(ParseError::unexpected_token_kind(SexprKind::String, token.kind), &token);
}

double ParserRef::expect_number()
{
  const SexprNode & token = consume();
  if (const auto * num = dyn_cast<NumberNode>(&token)) {
    return num->value;
  }
  fail(ParseError::unexpected_token_kind(SexprKind::Number, token.kind), &token);
}

void ParserRef::expect_symbol_matching(std::string_view value)
{
  const SexprNode * at = peek();
  const std::string_view found = expect_symbol();
  if (found != value) {
    fail(ParseError::non_matching_symbol(std::string(found), std::string(value)), at);
  }
}

bool ParserRef::expect_bool_with_name(std::string_view keyword, BoolSpelling * spelling)
{
  ParserRef child = expect_list_with_name(keyword);
  const SexprNode * at = child.peek();
  const std::string_view s = child.expect_symbol();
  bool value = false;
  BoolSpelling words = BoolSpelling::YesNo;
  if (!parse_bool_symbol(s, value, words)) {
    fail(ParseError::invalid_enum_value(std::string(s), "bool"), at);
  }
  child.expect_end();
  if (spelling != nullptr) {
    *spelling = words;
  }
  return value;
}

void ParserRef::expect_end()
{
  if (const SexprNode * token = peek()) {
    fail(ParseError::expected_end_of_list(materialize(*token)), token);
  }
}

std::string_view ParserRef::expect_string_with_name(std::string_view keyword)
{
  ParserRef child = expect_list_with_name(keyword);
  const std::string_view value = child.expect_string();
  child.expect_end();
  return value;
}

std::optional<std::string_view> ParserRef::maybe_string_with_name(std::string_view keyword)
{
  auto child = maybe_list_with_name(keyword);
  if (!child) {
    return std::nullopt;
  }
  const std::string_view value = child->expect_string();
  child->expect_end();
  return value;
}

double ParserRef::expect_number_with_name(std::string_view keyword)
{
  ParserRef child = expect_list_with_name(keyword);
  const double value = child.expect_number();
  child.expect_end();
  return value;
}

uint32_t ParserRef::expect_unsigned_with_name(std::string_view keyword)
{
  ParserRef child = expect_list_with_name(keyword);
  const SexprNode * at = child.peek();
  const double value = child.expect_number();
  uint32_t out = 0;
  if (!number_to_u32(value, out)) {
    fail(ParseError::invalid_enum_value(format_number(value), std::string(keyword)), at);
  }
  child.expect_end();
  return out;
}

std::optional<double> ParserRef::maybe_number_with_name(std::string_view keyword)
{
  auto child = maybe_list_with_name(keyword);
  if (!child) {
    return std::nullopt;
  }
  const double value = child->expect_number();
  child->expect_end();
  return value;
}

std::string_view ParserRef::expect_symbol_with_name(std::string_view keyword)
{
  ParserRef child = expect_list_with_name(keyword);
  const std::string_view value = child.expect_symbol();
  child.expect_end();
  return value;
}

std::optional<bool> ParserRef::maybe_bool_with_name(
  std::string_view keyword, BoolSpelling * spelling)
{
  const auto * list = dyn_cast<ListNode>(peek());
  if (list == nullptr || !list->has_name(keyword)) {
    return std::nullopt;
  }
  return expect_bool_with_name(keyword, spelling);
}

std::optional<double> ParserRef::maybe_number()
{
  const auto * num = dyn_cast<NumberNode>(peek());
  if (num == nullptr) {
    return std::nullopt;
  }
  ++pos_;
  return num->value;
}

bool ParserRef::maybe_symbol_matching(std::string_view value)
{
  const auto * sym = dyn_cast<SymbolNode>(peek());
  if (sym == nullptr || sym->text != value) {
    return false;
  }
  ++pos_;
  return true;
}

bool ParserRef::maybe_empty_list_with_name(std::string_view keyword)
{
  auto child = maybe_list_with_name(keyword);
  if (!child) {
    return false;
  }
  child->expect_end();
  return true;
}

KeywordFlag ParserRef::maybe_keyword_flag(std::string_view keyword)
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
