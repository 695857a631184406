#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "top100/driver/analyzer.hpp"
#include "top100/report/report_writer.hpp"
#include "top100/test_support/syntax_helpers.hpp"

using top100::AnalysisOptions;
using top100::Analyzer;
using top100::Metric;
using top100::ReportFormat;
using top100::test_support::read_text;
using top100::test_support::TempDir;

namespace
{

/// A class with `count` methods; method i holds i statements nested i levels deep
std::string generated_class(const std::string & name, int count)
{
  std::ostringstream src;
  src << "namespace Generated\n{\n    public class " << name << "\n    {\n";
  for (int i = 1; i <= count; ++i) {
    src << "        public void M" << i << "(bool flag)\n        {\n";
    for (int d = 0; d < i; ++d) {
      src << "            if (flag) {\n";
    }
    for (int s = 0; s < i; ++s) {
      src << "            System.Console.WriteLine(" << s << ");\n";
    }
    for (int d = 0; d < i; ++d) {
      src << "            }\n";
    }
    src << "        }\n";
  }
  src << "    }\n}\n";
  return src.str();
}

void populate(TempDir & dir)
{
  for (int f = 0; f < 12; ++f) {
    const std::string name = "Class" + std::to_string(f);
    dir.write(name + ".cs", generated_class(name, 5 + f % 4));
  }
  dir.write("Broken.cs", "class Broken { void M() { while (true { } }\n");
  dir.write("README.md", "not source\n");
  dir.write("nested/Hidden.cs", generated_class("Hidden", 30));
}

std::vector<std::string> lines_of(const std::string & text)
{
  std::vector<std::string> lines;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

TEST(Top100Pipeline, ReportsAreIdenticalForAnyWorkerCount)
{
  TempDir dir;
  populate(dir);

  std::vector<std::string> reference_statements;
  std::vector<std::string> reference_nesting;
  for (const unsigned jobs : {1U, 2U, 3U, 8U, 0U}) {
    AnalysisOptions options;
    options.jobs = jobs;
    const auto result = Analyzer::analyze(dir.path(), options);
    ASSERT_TRUE(result.success);

    const auto statements =
      top100::render_report(result.ranked(Metric::StatementCount, 20), ReportFormat::Text);
    const auto nesting =
      top100::render_report(result.ranked(Metric::NestingDepth, 20), ReportFormat::Text);

    if (reference_statements.empty()) {
      reference_statements = lines_of(statements);
      reference_nesting = lines_of(nesting);
    } else {
      EXPECT_EQ(lines_of(statements), reference_statements) << "jobs=" << jobs;
      EXPECT_EQ(lines_of(nesting), reference_nesting) << "jobs=" << jobs;
    }
  }

  ASSERT_EQ(reference_statements.size(), 20U);
  // Three files hold an M8; the tie is broken by file name
  EXPECT_EQ(reference_statements[0], "8\tClass11.cs:110");
  EXPECT_EQ(reference_statements[1], "8\tClass3.cs:110");
  EXPECT_EQ(reference_statements[2], "8\tClass7.cs:110");
  EXPECT_EQ(reference_nesting[0], "8\tClass11.cs:110");
}

TEST(Top100Pipeline, SkipsBrokenAndForeignFiles)
{
  TempDir dir;
  populate(dir);

  const auto result = Analyzer::analyze(dir.path(), AnalysisOptions{});
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.files_scanned, 13U);
  EXPECT_EQ(result.files_analyzed, 12U);
  EXPECT_EQ(result.files_skipped, 1U);

  size_t expected_members = 0;
  for (int f = 0; f < 12; ++f) expected_members += 5 + f % 4;
  EXPECT_EQ(result.members.size(), expected_members);

  for (const auto & m : result.members) {
    EXPECT_NE(m.file, "Broken.cs");
    EXPECT_NE(m.file, "Hidden.cs");
  }
}

TEST(Top100Pipeline, RecursiveRunReachesSubdirectories)
{
  TempDir dir;
  populate(dir);

  AnalysisOptions options;
  options.recursive = true;
  const auto result = Analyzer::analyze(dir.path(), options);
  ASSERT_TRUE(result.success);

  const auto top = result.ranked(Metric::NestingDepth, 1);
  ASSERT_EQ(top.size(), 1U);
  EXPECT_EQ(top[0].file, "Hidden.cs");
  EXPECT_EQ(top[0].value, 30U);
}

TEST(Top100Pipeline, WritesBothReportFiles)
{
  TempDir dir;
  populate(dir);
  const auto out_dir = dir.path() / "out";

  const auto result = Analyzer::analyze(dir.path(), AnalysisOptions{});
  ASSERT_TRUE(result.success);

  top100::DiagnosticBag diags;
  ASSERT_TRUE(top100::write_report(
    out_dir / "statements.txt", result.ranked(Metric::StatementCount, 100), ReportFormat::Text,
    diags));
  ASSERT_TRUE(top100::write_report(
    out_dir / "nesting.txt", result.ranked(Metric::NestingDepth, 100), ReportFormat::Text, diags));

  const auto statements = lines_of(read_text(out_dir / "statements.txt"));
  const auto nesting = lines_of(read_text(out_dir / "nesting.txt"));
  EXPECT_EQ(statements.size(), result.members.size());
  EXPECT_EQ(nesting.size(), result.members.size());

  for (const auto & line : statements) {
    const auto tab = line.find('\t');
    ASSERT_NE(tab, std::string::npos) << line;
    EXPECT_NE(line.find(".cs:", tab), std::string::npos) << line;
  }
}
