// top100/syntax/syntax_kind.hpp - Closed enumeration of syntax node kinds
//
// SyntaxKind is generated from syntax_kinds.def. Kinds are grouped by
// category so category checks are range comparisons.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace top100
{

// ============================================================================
// SyntaxKind - Identifies all syntax node types
// ============================================================================

enum class SyntaxKind : uint8_t {
#define SYNTAX_TOP(Kind, Snake) Kind,
#define SYNTAX_TYPE_DECL(Kind, Snake) Kind,
#define SYNTAX_DECL(Kind, Snake) Kind,
#define SYNTAX_MEMBER(Kind, Snake) Kind,
#define SYNTAX_STMT(Kind, Snake) Kind,
#define SYNTAX_EXPR(Kind, Snake) Kind,
#define SYNTAX_SUPPORT(Kind, Snake) Kind,
#include "top100/syntax/syntax_kinds.def"
};

// ============================================================================
// to_string() / grammar name lookup
// ============================================================================

/// Snake-case name of a kind (the tree-sitter node type where one exists)
[[nodiscard]] constexpr std::string_view to_string(SyntaxKind kind) noexcept
{
  switch (kind) {
#define SYNTAX_TOP(Kind, Snake) \
  case SyntaxKind::Kind:        \
    return #Snake;
#define SYNTAX_TYPE_DECL(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_DECL(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_MEMBER(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_STMT(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_EXPR(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_SUPPORT(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#include "top100/syntax/syntax_kinds.def"
  }
  return "";
}

/**
 * Map a tree-sitter-c-sharp node type to a SyntaxKind.
 *
 * Accepts every grammar name listed in syntax_kinds.def plus the aliases
 * older grammar releases use (e.g. "for_each_statement"). Unknown names map
 * to SyntaxKind::Other.
 */
[[nodiscard]] SyntaxKind kind_from_grammar_name(std::string_view name);

// ============================================================================
// SyntaxKind Range Helpers
// ============================================================================

namespace detail
{

/// First type declaration kind
inline constexpr SyntaxKind k_first_type_decl_kind = SyntaxKind::ClassDeclaration;
/// Last type declaration kind
inline constexpr SyntaxKind k_last_type_decl_kind = SyntaxKind::InterfaceDeclaration;

/// First statement kind
inline constexpr SyntaxKind k_first_stmt_kind = SyntaxKind::Block;
/// Last statement kind
inline constexpr SyntaxKind k_last_stmt_kind = SyntaxKind::YieldStatement;

/// First simple statement kind
inline constexpr SyntaxKind k_first_simple_stmt_kind = SyntaxKind::BreakStatement;

}  // namespace detail

/// Check if a kind is a class-like or struct-like type declaration (interfaces included)
[[nodiscard]] constexpr bool is_type_decl_kind(SyntaxKind kind) noexcept
{
  return kind >= detail::k_first_type_decl_kind && kind <= detail::k_last_type_decl_kind;
}

/// Check if a kind is any statement kind, block included
[[nodiscard]] constexpr bool is_stmt_kind(SyntaxKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

/// Check if a kind is the block kind
[[nodiscard]] constexpr bool is_block_kind(SyntaxKind kind) noexcept
{
  return kind == SyntaxKind::Block;
}

/// Check if a kind is a statement that owns no embedded statement
[[nodiscard]] constexpr bool is_simple_stmt_kind(SyntaxKind kind) noexcept
{
  return kind >= detail::k_first_simple_stmt_kind && kind <= detail::k_last_stmt_kind;
}

/// Statement kind other than block: the executable-code marker used by extraction
[[nodiscard]] constexpr bool is_executable_stmt_kind(SyntaxKind kind) noexcept
{
  return is_stmt_kind(kind) && !is_block_kind(kind);
}

}  // namespace top100
