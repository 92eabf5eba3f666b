// kicad_format/basic/string_interner.hpp - Shared instances for common property keys
//
// Property keys such as "Reference" or "Value" recur in every symbol of a
// library. intern_property_key() hands out one process-wide instance for a
// fixed set of known keys and a private copy for anything else.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>

namespace kicad_format
{

/**
 * A string that is either a view of a static interned instance or an owned
 * copy. Equality and ordering are by value only, so interning never changes
 * what a model compares equal to.
 */
class InternedString
{
public:
  InternedString() = default;

  /// Wrap a string with static storage duration without copying it.
  [[nodiscard]] static InternedString from_static(std::string_view s) noexcept
  {
    InternedString r;
    r.repr_ = s;
    return r;
  }

  [[nodiscard]] static InternedString from_string(std::string s)
  {
    InternedString r;
    r.repr_ = std::move(s);
    return r;
  }

  [[nodiscard]] std::string_view str() const noexcept
  {
    if (const auto * view = std::get_if<std::string_view>(&repr_)) {
      return *view;
    }
    return std::get<std::string>(repr_);
  }

  [[nodiscard]] bool is_static() const noexcept
  {
    return std::holds_alternative<std::string_view>(repr_);
  }

  /// True when both refer to the same shared static instance.
  [[nodiscard]] bool same_instance(const InternedString & other) const noexcept
  {
    return is_static() && other.is_static() && str().data() == other.str().data() &&
           str().size() == other.str().size();
  }

  [[nodiscard]] bool operator==(const InternedString & other) const noexcept
  {
    return str() == other.str();
  }
  [[nodiscard]] bool operator!=(const InternedString & other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] bool operator==(std::string_view other) const noexcept { return str() == other; }
  [[nodiscard]] bool operator!=(std::string_view other) const noexcept { return str() != other; }

private:
  std::variant<std::string_view, std::string> repr_;
};

std::ostream & operator<<(std::ostream & os, const InternedString & s);

/**
 * Look up a property key in the process-wide table.
 *
 * The table is built on first use (thread-safe, exactly once) and is
 * read-only afterwards. Known keys return the shared static instance;
 * unknown keys return an owned copy equal to the input.
 */
[[nodiscard]] InternedString intern_property_key(std::string_view key);

/// Number of keys in the shared table.
[[nodiscard]] size_t interned_property_key_count();

}  // namespace kicad_format
