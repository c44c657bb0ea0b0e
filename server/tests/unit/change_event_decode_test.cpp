#include <string>

#include <gtest/gtest.h>

#include "chatlive/change_event.hpp"

namespace {
const std::string kEntity = "01890a5d-ac96-774b-bcce-b302099a8057";
const std::string kTopic = "01890a5d-b000-7000-8000-000000000001";
}  // namespace

TEST(ChangeEventDecodeTest, DecodesEachChannel) {
  struct Case {
    const char* channel;
    chatlive::ChangeKind kind;
  };
  for (const auto& c : {Case{"insert", chatlive::ChangeKind::kInsert}, Case{"update", chatlive::ChangeKind::kUpdate},
                        Case{"delete", chatlive::ChangeKind::kDelete}}) {
    auto result = chatlive::DecodeNotification(c.channel, kEntity + kTopic);
    ASSERT_TRUE(result.event.has_value()) << c.channel;
    EXPECT_EQ(result.error, chatlive::DecodeError::kNone);
    EXPECT_EQ(result.event->kind, c.kind);
    EXPECT_EQ(result.event->entity_id.ToString(), kEntity);
    EXPECT_EQ(result.event->topic_id.ToString(), kTopic);
  }
}

TEST(ChangeEventDecodeTest, RejectsPayloadOffByOne) {
  auto short_result = chatlive::DecodeNotification("insert", (kEntity + kTopic).substr(0, 71));
  EXPECT_FALSE(short_result.event.has_value());
  EXPECT_EQ(short_result.error, chatlive::DecodeError::kMalformedPayloadLength);

  auto long_result = chatlive::DecodeNotification("insert", kEntity + kTopic + "0");
  EXPECT_FALSE(long_result.event.has_value());
  EXPECT_EQ(long_result.error, chatlive::DecodeError::kMalformedPayloadLength);

  auto empty_result = chatlive::DecodeNotification("delete", "");
  EXPECT_EQ(empty_result.error, chatlive::DecodeError::kMalformedPayloadLength);
}

TEST(ChangeEventDecodeTest, RejectsUnknownChannel) {
  auto result = chatlive::DecodeNotification("truncate", kEntity + kTopic);
  EXPECT_FALSE(result.event.has_value());
  EXPECT_EQ(result.error, chatlive::DecodeError::kUnknownChannel);
  EXPECT_EQ(chatlive::ToString(result.error), "unknown_channel");
  EXPECT_FALSE(result.reason.empty());
}

TEST(ChangeEventDecodeTest, RejectsMalformedIdentifier) {
  std::string bad_entity = kEntity;
  bad_entity[3] = 'x';
  auto result = chatlive::DecodeNotification("update", bad_entity + kTopic);
  EXPECT_FALSE(result.event.has_value());
  EXPECT_EQ(result.error, chatlive::DecodeError::kMalformedIdentifier);

  // 구분자를 넣으면 길이는 맞아도 두 번째 id가 어긋난다.
  auto shifted = chatlive::DecodeNotification("update", kEntity + ":" + kTopic.substr(0, 35));
  EXPECT_EQ(shifted.error, chatlive::DecodeError::kMalformedIdentifier);
}
