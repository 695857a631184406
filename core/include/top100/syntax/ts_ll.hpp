// top100/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST access)
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <string_view>

#include "top100/basic/source_manager.hpp"

namespace top100::ts_ll
{

// NOTE: The tree-sitter language entry point is provided by the installed
// tree-sitter-c-sharp grammar library (see CMakeLists.txt).
extern "C" const TSLanguage * tree_sitter_c_sharp();

//------------------------------------------------------------------------------
// Node - thin wrapper around TSNode
//------------------------------------------------------------------------------
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  [[nodiscard]] bool is_named() const noexcept { return ts_node_is_named(node_); }
  [[nodiscard]] bool has_error() const noexcept { return ts_node_has_error(node_); }
  [[nodiscard]] bool is_error() const noexcept { return ts_node_is_error(node_); }
  [[nodiscard]] bool is_missing() const noexcept { return ts_node_is_missing(node_); }

  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  /// 1-indexed line/column of the node's first byte
  [[nodiscard]] LineColumn start_position() const noexcept
  {
    const TSPoint p = ts_node_start_point(node_);
    return {p.row + 1, p.column + 1};
  }

  [[nodiscard]] uint32_t child_count() const noexcept { return ts_node_child_count(node_); }

  [[nodiscard]] Node child(uint32_t i) const noexcept { return Node(ts_node_child(node_, i)); }

  [[nodiscard]] Node child_by_field(std::string_view field) const noexcept
  {
    return Node(
      ts_node_child_by_field_name(node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Cursor - sibling iteration over a node's children
//------------------------------------------------------------------------------
class Cursor
{
public:
  explicit Cursor(Node n) : cursor_(ts_tree_cursor_new(n.raw())) {}
  Cursor(const Cursor &) = delete;
  Cursor & operator=(const Cursor &) = delete;
  Cursor(Cursor &&) = delete;
  Cursor & operator=(Cursor &&) = delete;
  ~Cursor() { ts_tree_cursor_delete(&cursor_); }

  [[nodiscard]] Node current_node() const noexcept
  {
    return Node(ts_tree_cursor_current_node(&cursor_));
  }

  [[nodiscard]] bool goto_first_child() noexcept
  {
    return ts_tree_cursor_goto_first_child(&cursor_);
  }
  [[nodiscard]] bool goto_next_sibling() noexcept
  {
    return ts_tree_cursor_goto_next_sibling(&cursor_);
  }

private:
  TSTreeCursor cursor_;
};

//------------------------------------------------------------------------------
// Tree/Parser - RAII wrappers
//------------------------------------------------------------------------------

/// Owns one parse result; nodes taken from it are valid while it lives
class Tree
{
public:
  explicit Tree(TSTree * t) noexcept : tree_(t) {}
  Tree(const Tree &) = delete;
  Tree & operator=(const Tree &) = delete;
  Tree(Tree &&) = delete;
  Tree & operator=(Tree &&) = delete;

  ~Tree()
  {
    if (tree_) ts_tree_delete(tree_);
  }

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_)) : Node();
  }

private:
  TSTree * tree_;
};

// A Parser is not thread-safe; every worker thread owns its own instance.
class Parser
{
public:
  /// @throws std::runtime_error if the C# grammar cannot be loaded
  Parser();
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  /// Parse UTF-8 source; the tree is null if tree-sitter gives up
  [[nodiscard]] Tree parse(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
};

}  // namespace top100::ts_ll
