// tests/unit/model/test_library_id.cpp - Library and unit identifiers
#include <gtest/gtest.h>

#include <string>

#include "kicad_format/convert/parse_error.hpp"
#include "kicad_format/model/library_id.hpp"

using namespace kicad_format;

TEST(LibraryId, ParsesQualifiedAndBareNames)
{
  const LibraryId qualified = LibraryId::parse("Device:R_Small");
  EXPECT_EQ(qualified.library(), "Device");
  EXPECT_EQ(qualified.name(), "R_Small");
  EXPECT_EQ(qualified.to_string(), "Device:R_Small");

  const LibraryId bare = LibraryId::parse("R_Small");
  EXPECT_FALSE(bare.library().has_value());
  EXPECT_EQ(bare.to_string(), "R_Small");
}

TEST(LibraryId, NamesMayContainSpacesAndUnderscores)
{
  const LibraryId id = LibraryId::parse("Connector:Conn 01x02_Pin");
  EXPECT_EQ(id.name(), "Conn 01x02_Pin");
  EXPECT_EQ(id.to_sexpr(), Sexpr::string("Connector:Conn 01x02_Pin"));
}

TEST(LibraryId, RejectsMalformedInput)
{
  const char * bad[] = {"", ":R", "Device:", "a:b:c"};
  for (const char * text : bad) {
    std::string reason;
    EXPECT_FALSE(LibraryId::try_parse(text, &reason)) << text;
    EXPECT_FALSE(reason.empty()) << text;

    try {
      (void)LibraryId::parse(text);
      ADD_FAILURE() << "accepted " << text;
    } catch (const ParseError & e) {
      EXPECT_EQ(e.kind(), ParseErrorKind::LibraryIdentifierMalformed);
      EXPECT_EQ(e.detail_if<LibraryIdentifierMalformed>()->input, text);
    }
  }
}

TEST(UnitId, SplitsFromTheRight)
{
  const UnitId id = UnitId::parse("Opamp_Dual_2_1");
  EXPECT_EQ(id.name(), "Opamp_Dual");
  EXPECT_EQ(id.unit(), 2u);
  EXPECT_EQ(id.style(), 1u);
  EXPECT_EQ(id.to_string(), "Opamp_Dual_2_1");

  const UnitId zero = UnitId::parse("R_0_1");
  EXPECT_EQ(zero.name(), "R");
  EXPECT_EQ(zero.unit(), 0u);
}

TEST(UnitId, RejectsNonCanonicalNumbers)
{
  for (const char * text : {"R", "R_1", "_1_1", "R_01_1", "R_1_x", "R_-1_1", "R__1"}) {
    EXPECT_FALSE(UnitId::try_parse(text)) << text;
  }
  EXPECT_THROW((void)UnitId::parse("R_a_1"), ParseError);
}
