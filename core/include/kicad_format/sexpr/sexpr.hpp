// kicad_format/sexpr/sexpr.hpp - Owning S-expression token tree
//
// A Sexpr is one of four kinds: Symbol, String, Number or List. It is a plain
// value type with structural equality. The owning Parser walks it, and every
// model's to_sexpr() produces it.
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kicad_format
{

enum class SexprKind : uint8_t {
  Symbol,
  String,
  Number,
  List,
};

[[nodiscard]] constexpr std::string_view to_string(SexprKind k) noexcept
{
  switch (k) {
    case SexprKind::Symbol:
      return "symbol";
    case SexprKind::String:
      return "string";
    case SexprKind::Number:
      return "number";
    case SexprKind::List:
      return "list";
  }
  return "";
}

/// The two word pairs KiCad accepts for a boolean atom.
enum class BoolSpelling : uint8_t {
  YesNo,      // `yes` / `no`
  TrueFalse,  // `true` / `false`
};

[[nodiscard]] constexpr std::string_view bool_symbol(bool value, BoolSpelling spelling) noexcept
{
  if (spelling == BoolSpelling::TrueFalse) {
    return value ? "true" : "false";
  }
  return value ? "yes" : "no";
}

[[nodiscard]] constexpr std::string_view to_string(BoolSpelling s) noexcept
{
  return s == BoolSpelling::TrueFalse ? "true_false" : "yes_no";
}

class Sexpr;
using SexprList = std::vector<Sexpr>;

class Sexpr
{
public:
  struct Symbol
  {
    std::string text;
    bool operator==(const Symbol & o) const { return text == o.text; }
  };

  struct String
  {
    std::string text;
    bool operator==(const String & o) const { return text == o.text; }
  };

  /// Default value is the empty list.
  Sexpr() = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  [[nodiscard]] static Sexpr symbol(std::string text);
  [[nodiscard]] static Sexpr string(std::string text);
  [[nodiscard]] static Sexpr number(double value);
  [[nodiscard]] static Sexpr list(SexprList items);

  /// `(name items...)`
  [[nodiscard]] static Sexpr list_with_name(std::string_view name, SexprList items = {});
  /// `(name value)` with a bare symbol value
  [[nodiscard]] static Sexpr symbol_with_name(std::string_view name, std::string_view value);
  /// `(name "value")`
  [[nodiscard]] static Sexpr string_with_name(std::string_view name, std::string_view value);
  /// `(name 1.27)`
  [[nodiscard]] static Sexpr number_with_name(std::string_view name, double value);
  /// `(name yes|no)`, or `(name true|false)` with BoolSpelling::TrueFalse
  [[nodiscard]] static Sexpr bool_with_name(
    std::string_view name, bool value, BoolSpelling spelling = BoolSpelling::YesNo);

  // ===========================================================================
  // Inspection
  // ===========================================================================

  [[nodiscard]] SexprKind kind() const noexcept { return static_cast<SexprKind>(value_.index()); }

  [[nodiscard]] bool is_symbol() const noexcept { return kind() == SexprKind::Symbol; }
  [[nodiscard]] bool is_string() const noexcept { return kind() == SexprKind::String; }
  [[nodiscard]] bool is_number() const noexcept { return kind() == SexprKind::Number; }
  [[nodiscard]] bool is_list() const noexcept { return kind() == SexprKind::List; }

  /// nullptr unless this is a Symbol
  [[nodiscard]] const std::string * as_symbol() const noexcept;
  /// nullptr unless this is a String
  [[nodiscard]] const std::string * as_string() const noexcept;
  /// nullptr unless this is a Number
  [[nodiscard]] const double * as_number() const noexcept;
  /// nullptr unless this is a List
  [[nodiscard]] const SexprList * as_list() const noexcept;
  [[nodiscard]] SexprList * as_list() noexcept;

  /// True for a List whose first element is Symbol(keyword).
  [[nodiscard]] bool is_list_with_name(std::string_view keyword) const noexcept;

  [[nodiscard]] bool operator==(const Sexpr & other) const { return value_ == other.value_; }
  [[nodiscard]] bool operator!=(const Sexpr & other) const { return !(*this == other); }

private:
  // Alternative order matches SexprKind.
  std::variant<Symbol, String, double, SexprList> value_{std::in_place_index<3>};
};

/// True for a List whose first element is Symbol(keyword).
[[nodiscard]] bool list_has_name(const SexprList & list, std::string_view keyword) noexcept;

/// Compact single-line rendering.
std::ostream & operator<<(std::ostream & os, const Sexpr & sexpr);

}  // namespace kicad_format
