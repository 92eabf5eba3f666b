// kicad_format/sexpr/sexpr_node.hpp - Arena-allocated borrowed token tree
//
// LLVM/Clang style with classof() for RTTI support. Nodes live in a
// SexprContext and view into the text buffer it owns.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "kicad_format/basic/casting.hpp"
#include "kicad_format/basic/source_manager.hpp"
#include "kicad_format/sexpr/sexpr.hpp"

namespace kicad_format
{

/**
 * Base class for all borrowed token tree nodes.
 *
 * Nodes are non-copyable, trivially destructible and owned by SexprContext.
 */
class SexprNode
{
public:
  const SexprKind kind;
  SourceRange range;

  SexprNode(const SexprNode &) = delete;
  SexprNode & operator=(const SexprNode &) = delete;
  SexprNode(SexprNode &&) = delete;
  SexprNode & operator=(SexprNode &&) = delete;

  [[nodiscard]] SexprKind get_kind() const noexcept { return kind; }

protected:
  SexprNode(SexprKind k, SourceRange r) : kind(k), range(r) {}
  ~SexprNode() = default;
};

/**
 * CRTP base class that implements classof() for one node kind.
 */
template <typename Derived, SexprKind K>
class SexprNodeBase : public SexprNode
{
public:
  static constexpr SexprKind node_kind = K;

  static bool classof(const SexprNode * node) { return node->get_kind() == K; }

protected:
  explicit SexprNodeBase(SourceRange r) : SexprNode(K, r) {}
};

class SymbolNode : public SexprNodeBase<SymbolNode, SexprKind::Symbol>
{
public:
  std::string_view text;

  SymbolNode(std::string_view t, SourceRange r) : SexprNodeBase(r), text(t) {}
};

/// A quoted string with escapes already resolved.
class StringNode : public SexprNodeBase<StringNode, SexprKind::String>
{
public:
  std::string_view text;

  StringNode(std::string_view t, SourceRange r) : SexprNodeBase(r), text(t) {}
};

class NumberNode : public SexprNodeBase<NumberNode, SexprKind::Number>
{
public:
  double value;

  NumberNode(double v, SourceRange r) : SexprNodeBase(r), value(v) {}
};

class ListNode : public SexprNodeBase<ListNode, SexprKind::List>
{
public:
  gsl::span<const SexprNode *> children;

  ListNode(gsl::span<const SexprNode *> c, SourceRange r) : SexprNodeBase(r), children(c) {}

  [[nodiscard]] size_t size() const noexcept { return children.size(); }
  [[nodiscard]] bool empty() const noexcept { return children.empty(); }

  /// True when the first child is Symbol(keyword).
  [[nodiscard]] bool has_name(std::string_view keyword) const noexcept
  {
    if (children.empty()) {
      return false;
    }
    const auto * head = dyn_cast<SymbolNode>(children[0]);
    return head != nullptr && head->text == keyword;
  }
};

/// Deep copy of a borrowed node into an owning tree.
[[nodiscard]] Sexpr materialize(const SexprNode & node);

}  // namespace kicad_format
