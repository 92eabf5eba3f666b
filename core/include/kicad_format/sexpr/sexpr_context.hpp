// kicad_format/sexpr/sexpr_context.hpp - Arena that owns a borrowed token tree
//
// SexprContext copies the source text into a PMR arena and builds SexprNodes
// that view into that copy. Every view handed out by ParserRef stays valid
// for as long as the context is alive.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "kicad_format/basic/result.hpp"
#include "kicad_format/sexpr/reader.hpp"
#include "kicad_format/sexpr/sexpr_node.hpp"

namespace kicad_format
{

using NodeReadResult = Result<const SexprNode *, SyntaxError>;

/**
 * Owns the text buffer and all nodes of a borrowed parse.
 *
 * Nothing but read() writes to the arena, and memory is only released when
 * the context is destroyed.
 *
 * Example:
 * @code
 *   SexprContext ctx;
 *   auto root = ctx.read(text);
 *   if (root) {
 *     auto lib = parse_symbol_library_fast(**root);
 *   }
 * @endcode
 */
class SexprContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit SexprContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size)
  {
  }

  ~SexprContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  SexprContext(const SexprContext &) = delete;
  SexprContext & operator=(const SexprContext &) = delete;
  SexprContext(SexprContext &&) = delete;
  SexprContext & operator=(SexprContext &&) = delete;

  /**
   * Copy `text` into the arena and build its token tree.
   *
   * @param text The source text (not retained)
   * @param file File the text belongs to, used for node ranges
   * @return The root node, or the first syntax error
   */
  [[nodiscard]] NodeReadResult read(std::string_view text, FileId file = FileId::invalid());

  /// The arena copy of the text most recently passed to read().
  [[nodiscard]] std::string_view source() const noexcept { return source_; }

  [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

  // ===========================================================================
  // Arena allocation
  // ===========================================================================

  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<SexprNode, T>, "T must derive from SexprNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Nodes must be trivially destructible to be managed by the arena");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    ++node_count_;
    return new (mem) T(std::forward<Args>(args)...);
  }

  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  [[nodiscard]] std::string_view copy_string(std::string_view s)
  {
    if (s.empty()) return {};
    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    return {ptr, s.size()};
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::string_view source_;
  size_t node_count_ = 0;
};

}  // namespace kicad_format
