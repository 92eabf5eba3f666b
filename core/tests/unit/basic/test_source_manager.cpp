// tests/unit/basic/test_source_manager.cpp - Source registry and line mapping
#include <gtest/gtest.h>

#include "kicad_format/basic/source_manager.hpp"

using namespace kicad_format;

TEST(SourceManager, LineColumnIsOneIndexed)
{
  const SourceFile file("a.kicad_sym", "(a\n  (b)\n)");

  const LineColumn start = file.line_column(0);
  EXPECT_EQ(start.line, 1u);
  EXPECT_EQ(start.column, 1u);

  // Offset 5 is the '(' of "(b)".
  const LineColumn inner = file.line_column(5);
  EXPECT_EQ(inner.line, 2u);
  EXPECT_EQ(inner.column, 3u);

  EXPECT_EQ(file.line_count(), 3u);
}

TEST(SourceManager, LineStripsTerminators)
{
  const SourceFile file("crlf.kicad_sym", "first\r\nsecond\n");
  EXPECT_EQ(file.line(0), "first");
  EXPECT_EQ(file.line(1), "second");
  EXPECT_EQ(file.line(2), "");
  EXPECT_EQ(file.line(10), "");
}

TEST(SourceManager, RegistryResolvesFullRanges)
{
  SourceRegistry registry;
  const FileId id = registry.add("lib.kicad_sym", "(x)\n(yy)");
  ASSERT_TRUE(id.is_valid());
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(registry.path_string(id), "lib.kicad_sym");

  const FullSourceRange fr = registry.full_range(SourceRange(id, 4, 8));
  ASSERT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 2u);
  EXPECT_EQ(fr.start_column, 1u);
  EXPECT_EQ(fr.end_column, 5u);
  EXPECT_EQ(fr.start_byte, 4u);
  EXPECT_EQ(fr.end_byte, 8u);
}

TEST(SourceManager, InvalidIdsAreHarmless)
{
  SourceRegistry registry;
  EXPECT_EQ(registry.file(FileId::invalid()), nullptr);
  EXPECT_EQ(registry.path_string(FileId::invalid()), "<unknown>");
  EXPECT_FALSE(registry.full_range(SourceRange()).is_valid());
  EXPECT_EQ(SourceRange().size(), 0u);
}
