#include <string>

#include <gtest/gtest.h>

#include "chatlive/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = chatlive::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = chatlive::MakeErrorEnvelope("live_updates_unavailable", "실시간 업데이트를 사용할 수 없습니다");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "live_updates_unavailable");
  EXPECT_EQ(env["error"]["message"], "실시간 업데이트를 사용할 수 없습니다");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(SseFrameTest, SingleLineFrame) {
  EXPECT_EQ(chatlive::ToSseFrame("message", "<li id=\"msg-1\"></li>"),
            "event: message\ndata: <li id=\"msg-1\"></li>\n\n");
}

TEST(SseFrameTest, MultiLineDataIsSplitPerLine) {
  EXPECT_EQ(chatlive::ToSseFrame("message", "<li>\r\n<div>a</div>\n</li>"),
            "event: message\ndata: <li>\ndata: <div>a</div>\ndata: </li>\n\n");
}

TEST(SseFrameTest, EmptyDataStillEmitsDataField) {
  EXPECT_EQ(chatlive::ToSseFrame("message", ""), "event: message\ndata: \n\n");
}

TEST(SseFrameTest, HeartbeatComment) { EXPECT_EQ(chatlive::ToSseComment("heartbeat"), ":heartbeat\n\n"); }

TEST(SseFrameTest, BareCarriageReturnCannotInjectFields) {
  auto frame = chatlive::ToSseFrame("message", "<div>a\revent: evil\r\rretry: 1</div>");
  EXPECT_EQ(frame, "event: message\ndata: <div>a\ndata: event: evil\ndata: \ndata: retry: 1</div>\n\n");
  EXPECT_EQ(frame.find('\r'), std::string::npos);
}
