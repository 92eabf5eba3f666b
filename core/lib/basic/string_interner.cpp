// kicad_format/basic/string_interner.cpp - Process-wide property key table
#include "kicad_format/basic/string_interner.hpp"

#include <array>
#include <ostream>
#include <unordered_set>

namespace kicad_format
{

namespace
{

constexpr std::array<std::string_view, 15> k_property_keys = {
  "Value",
  "Reference",
  "Footprint",
  "Datasheet",
  "ki_keywords",
  "ki_description",
  "ki_fp_filters",
  "D",
  "in_bom",
  "on_board",
  "pin_numbers",
  "power",
  "extends",
  "Description",
  "ki_locked",
};

// Views in the set point at the string literals above, which live for the
// whole program.
const std::unordered_set<std::string_view> & property_key_table()
{
  static const std::unordered_set<std::string_view> table(
    k_property_keys.begin(), k_property_keys.end());
  return table;
}

}  // namespace

std::ostream & operator<<(std::ostream & os, const InternedString & s) { return os << s.str(); }

InternedString intern_property_key(std::string_view key)
{
  const auto & table = property_key_table();
  if (auto it = table.find(key); it != table.end()) {
    return InternedString::from_static(*it);
  }
  return InternedString::from_string(std::string(key));
}

size_t interned_property_key_count() { return property_key_table().size(); }

}  // namespace kicad_format
