// kicad_format/convert/keyword_flag.hpp - Boolean with a recorded spelling
#pragma once

#include <cstdint>
#include <string_view>

#include "kicad_format/sexpr/sexpr.hpp"

namespace kicad_format
{

/**
 * A boolean flag such as `hide`, `bold` or `italic` together with the way it
 * was written: absent, as a bare keyword (legacy) or as `(keyword yes|no)`.
 * A named flag also remembers whether it used `yes`/`no` or `true`/`false`.
 */
struct KeywordFlag
{
  enum class Spelling : uint8_t {
    Omitted,  // no node, value is false
    Bare,     // `hide`, value is true
    Named,    // `(hide yes)` or `(hide no)`
  };

  bool value = false;
  Spelling spelling = Spelling::Omitted;
  BoolSpelling words = BoolSpelling::YesNo;  // only meaningful when Named

  [[nodiscard]] static constexpr KeywordFlag omitted() noexcept { return {}; }
  [[nodiscard]] static constexpr KeywordFlag bare() noexcept { return {true, Spelling::Bare}; }
  [[nodiscard]] static constexpr KeywordFlag named(
    bool v, BoolSpelling words = BoolSpelling::YesNo) noexcept
  {
    return {v, Spelling::Named, words};
  }

  [[nodiscard]] constexpr bool is_set() const noexcept { return value; }

  /// Append this flag's node, if any, to `out`.
  void append_to(SexprList & out, std::string_view keyword) const
  {
    switch (spelling) {
      case Spelling::Omitted:
        break;
      case Spelling::Bare:
        out.push_back(Sexpr::symbol(std::string(keyword)));
        break;
      case Spelling::Named:
        out.push_back(Sexpr::bool_with_name(keyword, value, words));
        break;
    }
  }

  [[nodiscard]] constexpr bool operator==(const KeywordFlag & o) const noexcept
  {
    return value == o.value && spelling == o.spelling &&
           (spelling != Spelling::Named || words == o.words);
  }
  [[nodiscard]] constexpr bool operator!=(const KeywordFlag & o) const noexcept
  {
    return !(*this == o);
  }
};

[[nodiscard]] constexpr std::string_view to_string(KeywordFlag::Spelling s) noexcept
{
  switch (s) {
    case KeywordFlag::Spelling::Omitted:
      return "omitted";
    case KeywordFlag::Spelling::Bare:
      return "bare";
    case KeywordFlag::Spelling::Named:
      return "named";
  }
  return "";
}

}  // namespace kicad_format
