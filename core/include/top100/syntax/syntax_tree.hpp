// top100/syntax/syntax_tree.hpp - Immutable syntax nodes and their arena
//
// SyntaxNode is the read-only tree every metric operates on. Nodes are
// allocated in a SyntaxContext and stay valid for the context's lifetime.
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <type_traits>
#include <utility>
#include <vector>

#include "top100/syntax/syntax_kind.hpp"

namespace top100
{

// ============================================================================
// SyntaxNode
// ============================================================================

/**
 * One node of a lowered syntax tree.
 *
 * Every node has:
 * - A SyntaxKind from the closed vocabulary in syntax_kinds.def
 * - Its ordered children (owned by the same SyntaxContext)
 * - The 1-based line of its first token
 *
 * Nodes are immutable after construction and are never reparented, so a tree
 * can be read from any number of threads without locking.
 */
class SyntaxNode
{
public:
  using Children = gsl::span<const SyntaxNode * const>;

  SyntaxNode(SyntaxKind kind, uint32_t line, Children children) noexcept
  : kind_(kind), line_(line), children_(children)
  {
  }

  // Non-copyable, non-movable (managed by SyntaxContext)
  SyntaxNode(const SyntaxNode &) = delete;
  SyntaxNode & operator=(const SyntaxNode &) = delete;
  SyntaxNode(SyntaxNode &&) = delete;
  SyntaxNode & operator=(SyntaxNode &&) = delete;
  ~SyntaxNode() = default;

  [[nodiscard]] SyntaxKind kind() const noexcept { return kind_; }

  /// 1-indexed line of the node's first token (0 = unknown)
  [[nodiscard]] uint32_t line() const noexcept { return line_; }

  [[nodiscard]] Children children() const noexcept { return children_; }

private:
  SyntaxKind kind_;
  uint32_t line_;
  Children children_;
};

// ============================================================================
// SyntaxContext - PMR arena for SyntaxNodes
// ============================================================================

/**
 * Owns every SyntaxNode of one file.
 *
 * Memory is released only when the context is destroyed; nodes and child
 * arrays are trivially destructible and never freed individually.
 *
 * Example:
 * @code
 *   SyntaxContext ctx;
 *   const auto * stmt = ctx.create(SyntaxKind::ReturnStatement, 3);
 *   const auto * block = ctx.create(SyntaxKind::Block, 2, {stmt});
 * @endcode
 */
class SyntaxContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit SyntaxContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size)
  {
  }

  ~SyntaxContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  SyntaxContext(const SyntaxContext &) = delete;
  SyntaxContext & operator=(const SyntaxContext &) = delete;
  SyntaxContext(SyntaxContext &&) = delete;
  SyntaxContext & operator=(SyntaxContext &&) = delete;

  /**
   * Create a node whose children are copied into the arena.
   *
   * Null entries in `children` are dropped.
   */
  const SyntaxNode * create(
    SyntaxKind kind, uint32_t line, const std::vector<const SyntaxNode *> & children = {})
  {
    static_assert(
      std::is_trivially_destructible_v<SyntaxNode>,
      "SyntaxNode must be trivially destructible to be managed by the arena");

    std::vector<const SyntaxNode *> kept;
    kept.reserve(children.size());
    for (const auto * c : children) {
      if (c != nullptr) kept.push_back(c);
    }

    const auto span = copy_to_arena(kept);
    void * const mem = arena_.allocate(sizeof(SyntaxNode), alignof(SyntaxNode));
    return new (mem) SyntaxNode(kind, line, SyntaxNode::Children(span.data(), span.size()));
  }

private:
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  std::pmr::monotonic_buffer_resource arena_;
};

}  // namespace top100
