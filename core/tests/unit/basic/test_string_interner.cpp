// tests/unit/basic/test_string_interner.cpp - Property key interning tests
#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "kicad_format/basic/string_interner.hpp"

using kicad_format::intern_property_key;
using kicad_format::interned_property_key_count;
using kicad_format::InternedString;

TEST(StringInterner, KnownKeyReturnsSharedInstance)
{
  const std::string first = "Reference";
  const std::string second = "Reference";

  const InternedString a = intern_property_key(first);
  const InternedString b = intern_property_key(second);

  EXPECT_EQ(a, b);
  EXPECT_TRUE(a.is_static());
  EXPECT_TRUE(a.same_instance(b));
  // The result does not point into the caller's buffer.
  EXPECT_NE(a.str().data(), first.data());
}

TEST(StringInterner, UnknownKeyIsCopiedVerbatim)
{
  std::string key = "Sim.Device";
  const InternedString s = intern_property_key(key);

  EXPECT_FALSE(s.is_static());
  EXPECT_EQ(s, "Sim.Device");

  key = "changed";
  EXPECT_EQ(s.str(), "Sim.Device");
}

TEST(StringInterner, InterningIsIdempotent)
{
  for (const char * key : {"Value", "ki_fp_filters", "MPN", ""}) {
    const InternedString once = intern_property_key(key);
    const InternedString twice = intern_property_key(once.str());
    EXPECT_EQ(once, twice) << key;
    EXPECT_EQ(once.is_static(), twice.is_static()) << key;
  }
}

TEST(StringInterner, LookupIsCaseSensitive)
{
  EXPECT_TRUE(intern_property_key("Value").is_static());
  EXPECT_FALSE(intern_property_key("value").is_static());
}

TEST(StringInterner, OwnedAndStaticCompareByValue)
{
  EXPECT_EQ(intern_property_key("Datasheet"), InternedString::from_string("Datasheet"));
  EXPECT_FALSE(
    intern_property_key("Datasheet").same_instance(InternedString::from_string("Datasheet")));
}

TEST(StringInterner, TableHasFixedKeySet)
{
  EXPECT_EQ(interned_property_key_count(), 15u);
  for (const char * key :
       {"Value", "Reference", "Footprint", "Datasheet", "ki_keywords", "ki_description",
        "ki_fp_filters", "D", "in_bom", "on_board", "pin_numbers", "power", "extends",
        "Description", "ki_locked"}) {
    EXPECT_TRUE(intern_property_key(key).is_static()) << key;
  }
}

TEST(StringInterner, ConcurrentFirstUseSeesOneTable)
{
  constexpr int k_threads = 8;
  std::vector<InternedString> results(k_threads);
  std::vector<std::thread> workers;
  workers.reserve(k_threads);
  for (int i = 0; i < k_threads; ++i) {
    workers.emplace_back([&results, i] { results[i] = intern_property_key("Footprint"); });
  }
  for (auto & t : workers) {
    t.join();
  }

  for (const auto & r : results) {
    EXPECT_TRUE(r.same_instance(results.front()));
  }
}
