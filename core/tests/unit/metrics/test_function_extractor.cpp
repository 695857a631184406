#include <gtest/gtest.h>

#include <iostream>

#include "top100/metrics/function_extractor.hpp"
#include "top100/test_support/syntax_helpers.hpp"

using top100::extract_members;
using top100::SyntaxKind;
using top100::test_support::TestTree;

namespace
{

void dump_diags(const top100::ParsedUnit & unit)
{
  for (const auto & d : unit.diags.all()) {
    std::cerr << "diag: " << d.message << " at " << d.location.position.line << ":"
              << d.location.position.column << "\n";
  }
}

}  // namespace

// ============================================================================
// Hand-built trees
// ============================================================================

TEST(FunctionExtractor, HasExecutableStatement)
{
  TestTree t;
  EXPECT_FALSE(top100::has_executable_statement(*t.leaf(SyntaxKind::MethodDeclaration)));
  EXPECT_FALSE(top100::has_executable_statement(*t.method({})));
  EXPECT_TRUE(top100::has_executable_statement(*t.method({t.leaf(SyntaxKind::ReturnStatement)})));
  EXPECT_TRUE(top100::has_executable_statement(*t.method({t.leaf(SyntaxKind::IfStatement)})));

  // The node itself is not a descendant
  EXPECT_FALSE(top100::has_executable_statement(*t.leaf(SyntaxKind::ReturnStatement)));
}

TEST(FunctionExtractor, PicksImmediateChildrenOfClasses)
{
  TestTree t;
  const auto * m1 = t.method({t.leaf(SyntaxKind::ReturnStatement)}, 3);
  const auto * field = t.node(SyntaxKind::FieldDeclaration, {t.leaf(SyntaxKind::Other)}, 5);
  const auto * m2 = t.method({t.leaf(SyntaxKind::ExpressionStatement)}, 7);
  const auto * cls = t.node(SyntaxKind::ClassDeclaration, {t.leaf(SyntaxKind::Other), m1, field, m2}, 1);
  const auto * root = t.node(SyntaxKind::CompilationUnit, {cls});

  const auto members = extract_members(*root, "A.cs");
  ASSERT_EQ(members.size(), 2U);
  EXPECT_EQ(members[0].node, m1);
  EXPECT_EQ(members[0].line(), 3U);
  EXPECT_EQ(members[0].file_name, "A.cs");
  EXPECT_EQ(members[1].node, m2);
  EXPECT_EQ(members[1].line(), 7U);
}

TEST(FunctionExtractor, TypeWithoutQualifyingMembersYieldsNothing)
{
  TestTree t;
  const auto * cls = t.node(
    SyntaxKind::ClassDeclaration,
    {t.leaf(SyntaxKind::Other), t.node(SyntaxKind::FieldDeclaration, {t.leaf(SyntaxKind::Other)}),
     t.method({})});
  const auto * root = t.node(SyntaxKind::CompilationUnit, {cls});
  EXPECT_TRUE(extract_members(*root, "A.cs").empty());
}

TEST(FunctionExtractor, InterfacesAreExcluded)
{
  TestTree t;
  const auto * iface = t.node(
    SyntaxKind::InterfaceDeclaration, {t.method({t.leaf(SyntaxKind::ReturnStatement)})});
  const auto * root = t.node(SyntaxKind::CompilationUnit, {iface});
  EXPECT_TRUE(extract_members(*root, "I.cs").empty());
}

TEST(FunctionExtractor, StatementsOutsideTypesAreIgnored)
{
  TestTree t;
  // Top-level statements and namespace-level code belong to no type
  const auto * root = t.node(
    SyntaxKind::CompilationUnit,
    {t.node(SyntaxKind::NamespaceDeclaration, {t.leaf(SyntaxKind::ExpressionStatement)}),
     t.leaf(SyntaxKind::ExpressionStatement)});
  EXPECT_TRUE(extract_members(*root, "P.cs").empty());
}

TEST(FunctionExtractor, VisitsNestedTypes)
{
  TestTree t;
  const auto * inner_method = t.method({t.leaf(SyntaxKind::ReturnStatement)}, 4);
  const auto * inner = t.node(SyntaxKind::StructDeclaration, {inner_method}, 3);
  const auto * outer = t.node(SyntaxKind::ClassDeclaration, {inner}, 2);
  const auto * ns = t.node(SyntaxKind::NamespaceDeclaration, {outer}, 1);
  const auto * root = t.node(SyntaxKind::CompilationUnit, {ns});

  const auto members = extract_members(*root, "N.cs");
  // The nested struct holds code, so it is itself a member of the outer class
  ASSERT_EQ(members.size(), 2U);
  EXPECT_EQ(members[0].node, inner);
  EXPECT_EQ(members[1].node, inner_method);
}

TEST(FunctionExtractor, NestedTypeMembersKeepDocumentOrder)
{
  TestTree t;
  const auto * first = t.method({t.leaf(SyntaxKind::ReturnStatement)}, 2);
  const auto * inner_method = t.method({t.leaf(SyntaxKind::ReturnStatement)}, 4);
  const auto * inner = t.node(SyntaxKind::ClassDeclaration, {inner_method}, 3);
  const auto * last = t.method({t.leaf(SyntaxKind::ReturnStatement)}, 6);
  const auto * outer = t.node(SyntaxKind::ClassDeclaration, {first, inner, last}, 1);
  const auto * root = t.node(SyntaxKind::CompilationUnit, {outer});

  const auto members = extract_members(*root, "O.cs");
  ASSERT_EQ(members.size(), 4U);
  EXPECT_EQ(members[0].node, first);
  EXPECT_EQ(members[1].node, inner);
  EXPECT_EQ(members[2].node, inner_method);
  EXPECT_EQ(members[3].node, last);
}

TEST(FunctionExtractor, VeryDeepMemberBody)
{
  TestTree t;
  const auto * body = t.nested(SyntaxKind::IfStatement, 100000, t.leaf(SyntaxKind::Other));
  const auto * m = t.method({body}, 2);
  const auto * cls = t.node(SyntaxKind::ClassDeclaration, {m}, 1);
  const auto * root = t.node(SyntaxKind::CompilationUnit, {cls});

  const auto members = extract_members(*root, "D.cs");
  ASSERT_EQ(members.size(), 1U);
  EXPECT_EQ(members[0].node, m);
}

// ============================================================================
// Parsed C#
// ============================================================================

TEST(FunctionExtractorParsed, MethodsConstructorsAndAccessors)
{
  const std::string src =
    "namespace Demo\n"
    "{\n"
    "    public class Account\n"
    "    {\n"
    "        private int balance;\n"
    "\n"
    "        public Account(int initial)\n"
    "        {\n"
    "            balance = initial;\n"
    "        }\n"
    "\n"
    "        public int Balance\n"
    "        {\n"
    "            get { return balance; }\n"
    "        }\n"
    "\n"
    "        public int Doubled => balance * 2;\n"
    "\n"
    "        public abstract void Reset();\n"
    "\n"
    "        public void Deposit(int amount)\n"
    "        {\n"
    "            if (amount > 0)\n"
    "            {\n"
    "                balance += amount;\n"
    "            }\n"
    "        }\n"
    "    }\n"
    "}\n";

  auto unit = top100::test_support::parse(src, "Account.cs");
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());
  ASSERT_NE(unit->root, nullptr);

  const auto members = extract_members(*unit->root, unit->source.file_name());
  ASSERT_EQ(members.size(), 3U);
  EXPECT_EQ(members[0].node->kind(), SyntaxKind::ConstructorDeclaration);
  EXPECT_EQ(members[0].line(), 7U);
  EXPECT_EQ(members[1].node->kind(), SyntaxKind::PropertyDeclaration);
  EXPECT_EQ(members[1].line(), 12U);
  EXPECT_EQ(members[2].node->kind(), SyntaxKind::MethodDeclaration);
  EXPECT_EQ(members[2].line(), 21U);
  for (const auto & m : members) {
    EXPECT_EQ(m.file_name, "Account.cs");
  }
}

TEST(FunctionExtractorParsed, InterfaceDefaultMethodsAreExcluded)
{
  const std::string src =
    "interface IGreeter\n"
    "{\n"
    "    void Greet() { System.Console.WriteLine(\"hi\"); }\n"
    "}\n"
    "struct Point\n"
    "{\n"
    "    public int X;\n"
    "    public void Reset() { X = 0; }\n"
    "}\n";

  auto unit = top100::test_support::parse(src);
  dump_diags(*unit);
  ASSERT_FALSE(unit->has_syntax_errors());

  const auto members = extract_members(*unit->root, "Test.cs");
  ASSERT_EQ(members.size(), 1U);
  EXPECT_EQ(members[0].node->kind(), SyntaxKind::MethodDeclaration);
  EXPECT_EQ(members[0].line(), 8U);
}
