#include <gtest/gtest.h>

#include "top100/basic/source_manager.hpp"
#include "top100/test_support/syntax_helpers.hpp"

using top100::SourceFile;

TEST(SourceFile, FileNameIsBaseName)
{
  const SourceFile f("some/dir/Program.cs", "");
  EXPECT_EQ(f.file_name(), "Program.cs");
  EXPECT_EQ(f.path().string(), "some/dir/Program.cs");
}

TEST(SourceFile, GetLineOfEmptyAndBlankLines)
{
  const SourceFile f("a.cs", "ab\ncd\n\nef");
  EXPECT_EQ(f.get_line(0), "ab");
  EXPECT_EQ(f.get_line(1), "cd");
  EXPECT_TRUE(f.get_line(2).empty());
  EXPECT_EQ(f.get_line(3), "ef");

  const SourceFile empty("b.cs", "");
  EXPECT_TRUE(empty.get_line(0).empty());
}

TEST(SourceFile, GetLineStripsLineBreaks)
{
  const SourceFile f("a.cs", "first\r\nsecond\nthird");
  EXPECT_EQ(f.get_line(0), "first");
  EXPECT_EQ(f.get_line(1), "second");
  EXPECT_EQ(f.get_line(2), "third");
  EXPECT_TRUE(f.get_line(3).empty());
}

TEST(SourceFile, ReadFileContent)
{
  top100::test_support::TempDir dir;
  const auto p = dir.write("x.cs", "class X { }\n");
  const auto content = top100::read_file_content(p);
  ASSERT_TRUE(content.has_value());
  EXPECT_EQ(*content, "class X { }\n");

  EXPECT_FALSE(top100::read_file_content(dir.path() / "missing.cs").has_value());
}
