// kicad_format/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any class hierarchy that implements the static `classof`
// pattern. Used on the arena-allocated SexprNode hierarchy.
//
// Usage:
//   if (isa<ListNode>(node)) { ... }
//   auto * list = cast<ListNode>(node);             // asserts on failure
//   if (auto * sym = dyn_cast<SymbolNode>(node)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>

namespace kicad_format
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True when `node` is non-null and of dynamic type T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(
    detail::HasClassof<T, From>::value, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

/// Checked downcast. `node` must be non-null and of type T.
template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

/// Downcast that yields nullptr when the type does not match.
template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace kicad_format
