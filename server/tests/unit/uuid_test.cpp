#include <chrono>

#include <gtest/gtest.h>

#include "chatlive/uuid.hpp"

namespace {
using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::seconds;
}  // namespace

TEST(UuidTest, ParsesCanonicalTextInEitherCase) {
  auto lower = chatlive::Uuid::Parse("01890a5d-ac96-774b-bcce-b302099a8057");
  auto upper = chatlive::Uuid::Parse("01890A5D-AC96-774B-BCCE-B302099A8057");
  ASSERT_TRUE(lower.has_value());
  ASSERT_TRUE(upper.has_value());
  EXPECT_EQ(*lower, *upper);
  EXPECT_EQ(upper->ToString(), "01890a5d-ac96-774b-bcce-b302099a8057");
  EXPECT_EQ(lower->Version(), 7);
}

TEST(UuidTest, RejectsNonCanonicalText) {
  EXPECT_FALSE(chatlive::Uuid::Parse("01890a5dac96774bbcceb302099a8057").has_value());
  EXPECT_FALSE(chatlive::Uuid::Parse("{01890a5d-ac96-774b-bcce-b302099a805}").has_value());
  EXPECT_FALSE(chatlive::Uuid::Parse("01890a5d-ac96-774b-bcce-b302099a805g").has_value());
  EXPECT_FALSE(chatlive::Uuid::Parse("01890a5d_ac96-774b-bcce-b302099a8057").has_value());
  EXPECT_FALSE(chatlive::Uuid::Parse("").has_value());
}

TEST(UuidTest, V7TimestampIsLeadingMilliseconds) {
  auto id = chatlive::Uuid::Parse("01890a5d-ac96-774b-bcce-b302099a8057");
  ASSERT_TRUE(id.has_value());
  auto ts = id->Timestamp();
  ASSERT_TRUE(ts.has_value());
  EXPECT_EQ(duration_cast<milliseconds>(ts->time_since_epoch()).count(), 1688096058518LL);
}

TEST(UuidTest, V1TimestampUsesGregorianEpoch) {
  auto id = chatlive::Uuid::Parse("c232ab00-9414-11ec-b3c8-9f6bdeced846");
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(id->Version(), 1);
  auto ts = id->Timestamp();
  ASSERT_TRUE(ts.has_value());
  EXPECT_EQ(duration_cast<seconds>(ts->time_since_epoch()).count(), 1645557742LL);
}

TEST(UuidTest, V4HasNoTimestamp) {
  auto id = chatlive::Uuid::Parse("2f1b8c4e-5d6a-4b3c-9e8f-7a6b5c4d3e2f");
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(id->Version(), 4);
  EXPECT_FALSE(id->Timestamp().has_value());
}

TEST(UuidTest, GeneratedV7CarriesCurrentTime) {
  auto before = std::chrono::system_clock::now();
  auto id = chatlive::Uuid::GenerateV7();
  auto after = std::chrono::system_clock::now();
  EXPECT_EQ(id.Version(), 7);
  auto reparsed = chatlive::Uuid::Parse(id.ToString());
  ASSERT_TRUE(reparsed.has_value());
  EXPECT_EQ(*reparsed, id);
  auto ts = id.Timestamp();
  ASSERT_TRUE(ts.has_value());
  EXPECT_GE(*ts, before - milliseconds(1));
  EXPECT_LE(*ts, after);
  EXPECT_NE(chatlive::Uuid::GenerateV7(), id);
}

TEST(UuidTest, TimestampBeyondClockRangeIsAbsent) {
  auto v7 = chatlive::Uuid::Parse("ffffffff-ffff-7fff-bfff-ffffffffffff");
  ASSERT_TRUE(v7.has_value());
  EXPECT_EQ(v7->Version(), 7);
  EXPECT_FALSE(v7->Timestamp().has_value());

  auto v1 = chatlive::Uuid::Parse("ffffffff-ffff-1fff-bfff-ffffffffffff");
  ASSERT_TRUE(v1.has_value());
  EXPECT_EQ(v1->Version(), 1);
  EXPECT_FALSE(v1->Timestamp().has_value());
}
