// kicad_format/convert/enum_traits.hpp - Symbol vocabularies of enumerations
#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "kicad_format/sexpr/sexpr.hpp"

namespace kicad_format
{

/**
 * Symbol vocabulary of an enumeration. Specialize with:
 *
 *   static constexpr std::string_view name;
 *   static std::optional<E> from_symbol(std::string_view);
 *   static std::string_view to_symbol(E);
 */
template <typename E>
struct EnumTraits;

/// Parse a bool spelled `yes`, `no`, `true` or `false`, recording which pair.
[[nodiscard]] constexpr bool parse_bool_symbol(
  std::string_view s, bool & out, BoolSpelling & spelling) noexcept
{
  if (s == "yes" || s == "no") {
    out = s == "yes";
    spelling = BoolSpelling::YesNo;
    return true;
  }
  if (s == "true" || s == "false") {
    out = s == "true";
    spelling = BoolSpelling::TrueFalse;
    return true;
  }
  return false;
}

/// Integral number token in [0, UINT32_MAX]. Fractions, negatives and NaN fail.
[[nodiscard]] inline bool number_to_u32(double value, uint32_t & out) noexcept
{
  if (!(value >= 0.0 && value <= static_cast<double>(UINT32_MAX)) || std::trunc(value) != value) {
    return false;
  }
  out = static_cast<uint32_t>(value);
  return true;
}

template <typename E, size_t N>
using EnumTable = std::array<std::pair<std::string_view, E>, N>;

template <typename E, size_t N>
[[nodiscard]] std::optional<E> lookup_enum(const EnumTable<E, N> & table, std::string_view s)
{
  for (const auto & [text, value] : table) {
    if (text == s) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename E, size_t N>
[[nodiscard]] std::string_view lookup_enum_symbol(const EnumTable<E, N> & table, E v)
{
  for (const auto & [text, value] : table) {
    if (value == v) {
      return text;
    }
  }
  return "";
}

}  // namespace kicad_format
