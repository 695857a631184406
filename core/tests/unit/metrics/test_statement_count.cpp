#include <gtest/gtest.h>

#include "top100/metrics/statement_count.hpp"
#include "top100/test_support/syntax_helpers.hpp"

using top100::statement_count;
using top100::StatementSet;
using top100::SyntaxKind;
using top100::test_support::TestTree;

TEST(StatementCount, LeafNonStatementIsZero)
{
  TestTree t;
  EXPECT_EQ(statement_count(*t.leaf(SyntaxKind::Other)), 0U);
  EXPECT_EQ(statement_count(*t.leaf(SyntaxKind::Block)), 0U);
  EXPECT_EQ(statement_count(*t.leaf(SyntaxKind::Block), StatementSet::All), 0U);
}

TEST(StatementCount, CountsTheNodeItself)
{
  TestTree t;
  EXPECT_EQ(statement_count(*t.leaf(SyntaxKind::ReturnStatement)), 1U);
  EXPECT_EQ(statement_count(*t.leaf(SyntaxKind::IfStatement)), 0U);
  EXPECT_EQ(statement_count(*t.leaf(SyntaxKind::IfStatement), StatementSet::All), 1U);
}

TEST(StatementCount, ThreeSimpleStatements)
{
  TestTree t;
  const auto * m = t.method({
    t.leaf(SyntaxKind::LocalDeclarationStatement),
    t.leaf(SyntaxKind::ExpressionStatement),
    t.leaf(SyntaxKind::ReturnStatement),
  });
  EXPECT_EQ(statement_count(*m), 3U);
  EXPECT_EQ(statement_count(*m, StatementSet::All), 3U);
}

TEST(StatementCount, NestedStatementCountsOnce)
{
  TestTree t;
  const auto * loop = t.with_block(SyntaxKind::WhileStatement, {t.leaf(SyntaxKind::ExpressionStatement)});
  const auto * m = t.method({t.with_block(SyntaxKind::IfStatement, {t.with_block(SyntaxKind::IfStatement, {loop})})});

  EXPECT_EQ(statement_count(*m), 1U);
  EXPECT_EQ(statement_count(*m, StatementSet::All), 4U);
}

TEST(StatementCount, BlocksNeverCount)
{
  TestTree t;
  const auto * m = t.method({t.node(
    SyntaxKind::Block,
    {t.node(SyntaxKind::Block, {t.leaf(SyntaxKind::ThrowStatement)}), t.leaf(SyntaxKind::EmptyStatement)})});
  EXPECT_EQ(statement_count(*m), 2U);
  EXPECT_EQ(statement_count(*m, StatementSet::All), 2U);
}

TEST(StatementCount, StatementsInsideLambdasCount)
{
  TestTree t;
  const auto * lambda = t.node(
    SyntaxKind::SimpleLambdaExpression,
    {t.leaf(SyntaxKind::Other), t.node(SyntaxKind::Block, {t.leaf(SyntaxKind::ReturnStatement)})});
  const auto * m = t.method({t.node(SyntaxKind::ExpressionStatement, {lambda})});
  EXPECT_EQ(statement_count(*m), 2U);
}

TEST(StatementCount, SimpleSetMembership)
{
  using top100::counts_as_statement;
  const SyntaxKind simple[] = {
    SyntaxKind::BreakStatement,      SyntaxKind::ContinueStatement, SyntaxKind::EmptyStatement,
    SyntaxKind::ExpressionStatement, SyntaxKind::GotoStatement,     SyntaxKind::LocalDeclarationStatement,
    SyntaxKind::ReturnStatement,     SyntaxKind::ThrowStatement,    SyntaxKind::YieldStatement,
  };
  for (const SyntaxKind k : simple) {
    EXPECT_TRUE(counts_as_statement(k, StatementSet::Simple)) << top100::to_string(k);
    EXPECT_TRUE(counts_as_statement(k, StatementSet::All)) << top100::to_string(k);
  }

  const SyntaxKind compound[] = {
    SyntaxKind::IfStatement,  SyntaxKind::ForStatement,   SyntaxKind::TryStatement,
    SyntaxKind::UsingStatement, SyntaxKind::LocalFunctionStatement, SyntaxKind::LabeledStatement,
  };
  for (const SyntaxKind k : compound) {
    EXPECT_FALSE(counts_as_statement(k, StatementSet::Simple)) << top100::to_string(k);
    EXPECT_TRUE(counts_as_statement(k, StatementSet::All)) << top100::to_string(k);
  }

  EXPECT_FALSE(counts_as_statement(SyntaxKind::Block, StatementSet::All));
  EXPECT_FALSE(counts_as_statement(SyntaxKind::MethodDeclaration, StatementSet::All));
  EXPECT_FALSE(counts_as_statement(SyntaxKind::CatchClause, StatementSet::All));
}

TEST(StatementCount, ParseStatementSet)
{
  EXPECT_EQ(top100::parse_statement_set("simple"), StatementSet::Simple);
  EXPECT_EQ(top100::parse_statement_set("all"), StatementSet::All);
  EXPECT_FALSE(top100::parse_statement_set("ALL").has_value());
  EXPECT_FALSE(top100::parse_statement_set("").has_value());
  EXPECT_EQ(top100::to_string(StatementSet::All), "all");
}

TEST(StatementCount, VeryDeepChain)
{
  constexpr uint32_t depth = 100000;
  TestTree t;
  const auto * m =
    t.method({t.nested(SyntaxKind::WhileStatement, depth, t.leaf(SyntaxKind::ReturnStatement))});
  EXPECT_EQ(statement_count(*m, StatementSet::Simple), 1U);
  EXPECT_EQ(statement_count(*m, StatementSet::All), depth + 1);
}
