// kicad_format/sexpr/lexer.cpp - Tokenizer for KiCad S-expression text
#include "kicad_format/sexpr/lexer.hpp"

#include <charconv>

namespace kicad_format::sexpr
{
namespace
{

bool is_whitespace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

bool is_atom_char(char c) { return !is_whitespace(c) && c != '(' && c != ')' && c != '"'; }

bool is_number_char(char c)
{
  return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

}  // namespace

std::optional<double> parse_number_atom(std::string_view text) noexcept
{
  if (text.empty()) {
    return std::nullopt;
  }
  // Restrict to plain decimal spellings so atoms like `inf` or `nan` stay symbols.
  for (const char c : text) {
    if (!is_number_char(c)) {
      return std::nullopt;
    }
  }

  // from_chars does not accept a leading '+'.
  std::string_view digits = text;
  if (digits.front() == '+') {
    digits.remove_prefix(1);
  }

  double value = 0.0;
  const char * const last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::string unescape_string(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }
    const char e = raw[++i];
    switch (e) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        // `\"`, `\\` and unknown escapes keep the escaped character
        out.push_back(e);
        break;
    }
  }
  return out;
}

void Lexer::skip_whitespace()
{
  while (!eof() && is_whitespace(peek())) {
    advance(1);
  }
}

Token Lexer::lex_atom()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && is_atom_char(peek())) {
    advance(1);
  }
  const auto end = static_cast<uint32_t>(pos_);

  Token t;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);
  t.kind = parse_number_atom(t.text) ? TokenKind::Number : TokenKind::Symbol;
  return t;
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // opening quote

  bool escapes = false;
  bool terminated = false;
  while (!eof()) {
    const char c = peek();
    if (c == '\\') {
      escapes = true;
      advance(2);
      continue;
    }
    if (c == '"') {
      terminated = true;
      break;
    }
    advance(1);
  }

  // An escape at the very end may step past the buffer.
  if (pos_ > src_.size()) {
    pos_ = src_.size();
  }

  Token t;
  const auto content_end = static_cast<uint32_t>(pos_);
  if (terminated) {
    advance(1);  // closing quote
    t.kind = TokenKind::String;
  } else {
    t.kind = TokenKind::Unknown;
  }
  t.range = make_range(start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(start + 1, content_end - (start + 1));
  t.has_escapes = escapes;
  return t;
}

Token Lexer::next_token()
{
  skip_whitespace();

  const auto start = static_cast<uint32_t>(pos_);
  if (eof()) {
    Token t;
    t.kind = TokenKind::Eof;
    t.range = make_range(start, start);
    return t;
  }

  const char c = peek();
  if (c == '(' || c == ')') {
    advance(1);
    Token t;
    t.kind = (c == '(') ? TokenKind::LParen : TokenKind::RParen;
    t.range = make_range(start, start + 1);
    t.text = src_.substr(start, 1);
    return t;
  }
  if (c == '"') {
    return lex_string();
  }
  return lex_atom();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> tokens;
  tokens.reserve(src_.size() / 4);
  for (;;) {
    Token t = next_token();
    const bool done = t.kind == TokenKind::Eof;
    tokens.push_back(t);
    if (done) {
      break;
    }
  }
  return tokens;
}

}  // namespace kicad_format::sexpr
