// top100/syntax/syntax_kind.cpp - Grammar name -> SyntaxKind lookup
#include "top100/syntax/syntax_kind.hpp"

#include <unordered_map>

namespace top100
{

namespace
{

using KindTable = std::unordered_map<std::string_view, SyntaxKind>;

KindTable build_kind_table()
{
  KindTable table;
#define SYNTAX_TOP(Kind, Snake) table.emplace(#Snake, SyntaxKind::Kind);
#define SYNTAX_TYPE_DECL(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_DECL(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_MEMBER(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_STMT(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_EXPR(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#define SYNTAX_SUPPORT(Kind, Snake) SYNTAX_TOP(Kind, Snake)
#include "top100/syntax/syntax_kinds.def"

  // Names used by other tree-sitter-c-sharp releases.
  table.emplace("for_each_statement", SyntaxKind::ForEachStatement);
  table.emplace("record_struct_declaration", SyntaxKind::RecordDeclaration);
  return table;
}

}  // namespace

SyntaxKind kind_from_grammar_name(std::string_view name)
{
  static const KindTable table = build_kind_table();
  if (const auto it = table.find(name); it != table.end()) {
    return it->second;
  }
  return SyntaxKind::Other;
}

}  // namespace top100
