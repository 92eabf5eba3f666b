// kicad_format/convert/parser_ref.hpp - Borrowing token cursor
//
// ParserRef has the same contract as Parser but walks arena nodes owned by a
// SexprContext. Strings come back as views into the arena, so nothing is
// copied until a model stores a value.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kicad_format/convert/enum_traits.hpp"
#include "kicad_format/convert/keyword_flag.hpp"
#include "kicad_format/convert/parse_error.hpp"
#include "kicad_format/sexpr/sexpr_node.hpp"

namespace kicad_format
{

/**
 * Sequential, consuming cursor over the children of one ListNode.
 *
 * Views returned by this cursor are valid as long as the SexprContext that
 * owns the nodes. Errors carry the source range of the offending node.
 */
class ParserRef
{
public:
  explicit ParserRef(const ListNode & list) : children_(list.children), range_(list.range) {}

  // ===========================================================================
  // Primitives
  // ===========================================================================

  [[nodiscard]] const SexprNode * peek() const noexcept
  {
    return at_end() ? nullptr : children_[pos_];
  }

  [[nodiscard]] const SexprNode * peek_second() const noexcept
  {
    return pos_ + 1 < children_.size() ? children_[pos_ + 1] : nullptr;
  }

  const SexprNode & next();

  [[nodiscard]] bool at_end() const noexcept { return pos_ >= children_.size(); }
  [[nodiscard]] size_t position() const noexcept { return pos_; }
  [[nodiscard]] size_t remaining() const noexcept { return children_.size() - pos_; }

  /// All children of the underlying list, consumed or not.
  [[nodiscard]] gsl::span<const SexprNode * const> nodes() const noexcept { return children_; }

  /// Range of the list this cursor walks.
  [[nodiscard]] SourceRange range() const noexcept { return range_; }

  ParserRef expect_list();
  ParserRef expect_list_with_name(std::string_view keyword);
  std::optional<ParserRef> maybe_list_with_name(std::string_view keyword);

  std::string_view expect_symbol();
  std::string_view expect_string();
  double expect_number();

  void expect_symbol_matching(std::string_view value);
  /// `(keyword yes|no|true|false)`; `spelling`, when given, receives the word pair used.
  bool expect_bool_with_name(std::string_view keyword, BoolSpelling * spelling = nullptr);
  void expect_end();

  // ===========================================================================
  // Helpers for `(keyword value)` fields
  // ===========================================================================

  std::string_view expect_string_with_name(std::string_view keyword);
  std::optional<std::string_view> maybe_string_with_name(std::string_view keyword);
  double expect_number_with_name(std::string_view keyword);
  uint32_t expect_unsigned_with_name(std::string_view keyword);
  std::optional<double> maybe_number_with_name(std::string_view keyword);
  std::string_view expect_symbol_with_name(std::string_view keyword);
  std::optional<bool> maybe_bool_with_name(
    std::string_view keyword, BoolSpelling * spelling = nullptr);
  std::optional<double> maybe_number();
  bool maybe_symbol_matching(std::string_view value);
  bool maybe_empty_list_with_name(std::string_view keyword);
  KeywordFlag maybe_keyword_flag(std::string_view keyword);

  template <typename E>
  E expect_enum()
  {
    const SexprNode * at = peek();
    const std::string_view s = expect_symbol();
    if (auto v = EnumTraits<E>::from_symbol(s)) {
      return *v;
    }
    fail(ParseError::invalid_enum_value(std::string(s), std::string(EnumTraits<E>::name)), at);
  }

  // ===========================================================================
  // Entity combinators
  // ===========================================================================

  template <typename T>
  T expect()
  {
    ParserRef child = expect_list();
    try {
      return T::from_sexpr_ref(child);
    } catch (ParseError & e) {
      e.set_range_if_unset(child.range());
      // Dispatching entities have no keyword of their own.
      if (!T::k_keyword.empty()) {
        e.push_context(T::k_keyword);
      }
      throw;
    }
  }

  template <typename T>
  std::optional<T> maybe()
  {
    const auto * list = dyn_cast<ListNode>(peek());
    if (list == nullptr || !T::is_present_ref(*list)) {
      return std::nullopt;
    }
    return expect<T>();
  }

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
  ParserRef(gsl::span<const SexprNode * const> children, SourceRange range, size_t pos)
  : children_(children), range_(range), pos_(pos)
  {
  }

  const SexprNode & consume();

  /// Throw `error` located at `at`, or at the end of this list when null.
  [[noreturn]] void fail(ParseError error, const SexprNode * at) const;

  gsl::span<const SexprNode * const> children_;
  SourceRange range_;
  size_t pos_ = 0;
};

}  // namespace kicad_format
