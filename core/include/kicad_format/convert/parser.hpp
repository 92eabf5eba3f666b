// kicad_format/convert/parser.hpp - Owning token cursor
//
// Parser walks one nesting level of an owning token tree. The sibling list is
// held through a shared_ptr that aliases the root tree, so copying a cursor
// (taking a snapshot) is O(1) and child cursors keep the whole tree alive.
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kicad_format/convert/enum_traits.hpp"
#include "kicad_format/convert/keyword_flag.hpp"
#include "kicad_format/convert/parse_error.hpp"
#include "kicad_format/sexpr/sexpr.hpp"

namespace kicad_format
{

/**
 * Sequential, consuming cursor over a list of sibling tokens.
 *
 * The position never moves backwards. To backtrack, copy the cursor before
 * consuming and continue from the copy.
 *
 * Every expect_* operation throws ParseError on failure; maybe_* operations
 * leave the cursor untouched when the next token does not match.
 */
class Parser
{
public:
  explicit Parser(SexprList list);
  explicit Parser(std::shared_ptr<const SexprList> list);

  /// Cursor over the contents of `tree`, which must be a list.
  [[nodiscard]] static Parser from_tree(const Sexpr & tree);

  // ===========================================================================
  // Primitives
  // ===========================================================================

  /// Next token without consuming it, or nullptr when exhausted.
  [[nodiscard]] const Sexpr * peek() const noexcept;

  /// Token after the next one, or nullptr.
  [[nodiscard]] const Sexpr * peek_second() const noexcept;

  /// Consume and return the next token.
  Sexpr next();

  [[nodiscard]] bool at_end() const noexcept { return pos_ >= list_->size(); }
  [[nodiscard]] size_t position() const noexcept { return pos_; }
  [[nodiscard]] size_t remaining() const noexcept { return list_->size() - pos_; }

  Parser expect_list();
  Parser expect_list_with_name(std::string_view keyword);
  std::optional<Parser> maybe_list_with_name(std::string_view keyword);

  std::string expect_symbol();
  std::string expect_string();
  double expect_number();

  void expect_symbol_matching(std::string_view value);
  /// `(keyword yes|no|true|false)`; `spelling`, when given, receives the word pair used.
  bool expect_bool_with_name(std::string_view keyword, BoolSpelling * spelling = nullptr);
  void expect_end();

  // ===========================================================================
  // Helpers for `(keyword value)` fields
  // ===========================================================================

  std::string expect_string_with_name(std::string_view keyword);
  std::optional<std::string> maybe_string_with_name(std::string_view keyword);
  double expect_number_with_name(std::string_view keyword);
  /// `(keyword N)` where N is an integer in [0, UINT32_MAX].
  uint32_t expect_unsigned_with_name(std::string_view keyword);
  std::optional<double> maybe_number_with_name(std::string_view keyword);
  std::string expect_symbol_with_name(std::string_view keyword);
  std::optional<bool> maybe_bool_with_name(
    std::string_view keyword, BoolSpelling * spelling = nullptr);

  /// Consume a bare number if one is next.
  std::optional<double> maybe_number();

  /// Consume Symbol(value) if it is next.
  bool maybe_symbol_matching(std::string_view value);

  /// Consume `(keyword)` if it is next.
  bool maybe_empty_list_with_name(std::string_view keyword);

  /// Bare `keyword`, `(keyword yes|no)` or nothing.
  KeywordFlag maybe_keyword_flag(std::string_view keyword);

  template <typename E>
  E expect_enum()
  {
    const std::string s = expect_symbol();
    if (auto v = EnumTraits<E>::from_symbol(s)) {
      return *v;
    }
    throw ParseError::invalid_enum_value(s, std::string(EnumTraits<E>::name));
  }

  // ===========================================================================
  // Entity combinators
  // ===========================================================================

  /// Parse a required entity. Errors are tagged with the entity keyword.
  template <typename T>
  T expect()
  {
    Parser child = expect_list();
    try {
      return T::from_sexpr(std::move(child));
    } catch (ParseError & e) {
      // Dispatching entities have no keyword of their own.
      if (!T::k_keyword.empty()) {
        e.push_context(T::k_keyword);
      }
      throw;
    }
  }

  /// Parse an entity only if its presence test accepts the next token.
  template <typename T>
  std::optional<T> maybe()
  {
    const Sexpr * next_token = peek();
    if (next_token == nullptr) {
      return std::nullopt;
    }
    const SexprList * items = next_token->as_list();
    if (items == nullptr || !T::is_present(*items)) {
      return std::nullopt;
    }
    return expect<T>();
  }

  /// Parse entities until the presence test rejects the next token.
  template <typename T>
  std::vector<T> expect_many()
  {
    std::vector<T> out;
    while (auto item = maybe<T>()) {
      out.push_back(std::move(*item));
    }
    return out;
  }

private:
  const Sexpr & consume();

  std::shared_ptr<const SexprList> list_;
  size_t pos_ = 0;
};

}  // namespace kicad_format
