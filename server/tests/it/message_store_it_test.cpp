#include <atomic>
#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "chatlive/auth.hpp"
#include "chatlive/change_event.hpp"
#include "chatlive/change_feed.hpp"
#include "chatlive/message_store.hpp"

namespace {

chatlive::DbConfig TestDbConfig() {
  chatlive::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

// sql/001_live_updates.sql이 적용되어 있어야 한다.
void Execute(const std::shared_ptr<chatlive::MariaDbClient>& db_client, const std::string& sql) {
  db_client->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, sql.c_str()) != 0) {
      db_client->RaiseError(conn, "테스트 SQL 실패");
    }
  });
}

class MessageStoreItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<chatlive::MariaDbClient>(TestDbConfig());
    author_ = chatlive::Uuid::GenerateV7();
    channel_ = chatlive::Uuid::GenerateV7();
    Execute(db_client_, "INSERT INTO chat_users (id, name) VALUES ('" + author_.ToString() + "', 'alpha')");
  }

  void TearDown() override {
    Execute(db_client_, "DELETE FROM messages WHERE channel_id = '" + channel_.ToString() + "'");
    Execute(db_client_, "DELETE FROM chat_users WHERE id = '" + author_.ToString() + "'");
  }

  chatlive::Uuid InsertMessage(const std::string& content) {
    auto id = chatlive::Uuid::GenerateV7();
    Execute(db_client_, "INSERT INTO messages (id, channel_id, author, content, updated) VALUES ('" + id.ToString() +
                            "', '" + channel_.ToString() + "', '" + author_.ToString() + "', '" + content +
                            "', '2024-03-01 12:30:45.250000')");
    return id;
  }

  std::shared_ptr<chatlive::MariaDbClient> db_client_;
  chatlive::Uuid author_;
  chatlive::Uuid channel_;
};

TEST_F(MessageStoreItTest, FetchJoinsAuthorName) {
  auto id = InsertMessage("hello <b>world</b>");
  chatlive::MariaDbMessageStore store(db_client_);
  auto message = store.FetchMessage(id);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->id, id);
  EXPECT_EQ(message->content, "hello <b>world</b>");
  EXPECT_EQ(message->author, author_);
  EXPECT_EQ(message->author_name, "alpha");
  auto expected = chatlive::ParseDbTimestamp("2024-03-01 12:30:45.250000");
  ASSERT_TRUE(expected.has_value());
  EXPECT_EQ(message->updated, *expected);
}

TEST_F(MessageStoreItTest, UnknownIdIsNotFound) {
  chatlive::MariaDbMessageStore store(db_client_);
  EXPECT_FALSE(store.FetchMessage(chatlive::Uuid::GenerateV7()).has_value());
}

TEST_F(MessageStoreItTest, TriggersFeedInsertUpdateDeleteInOrder) {
  chatlive::MariaDbNotificationSource source(db_client_);
  auto start = source.LatestSequence();

  auto id = InsertMessage("first");
  Execute(db_client_, "UPDATE messages SET content = 'edited' WHERE id = '" + id.ToString() + "'");
  Execute(db_client_, "DELETE FROM messages WHERE id = '" + id.ToString() + "'");

  auto batch = source.FetchAfter(start, 100);
  std::vector<chatlive::ChangeEvent> events;
  for (const auto& notification : batch) {
    EXPECT_GT(notification.seq, start);
    auto result = chatlive::DecodeNotification(notification.channel, notification.payload);
    ASSERT_TRUE(result.event.has_value()) << result.reason;
    if (result.event->topic_id == channel_) {
      events.push_back(*result.event);
    }
  }
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].kind, chatlive::ChangeKind::kInsert);
  EXPECT_EQ(events[1].kind, chatlive::ChangeKind::kUpdate);
  EXPECT_EQ(events[2].kind, chatlive::ChangeKind::kDelete);
  for (const auto& event : events) {
    EXPECT_EQ(event.entity_id, id);
  }
}

TEST_F(MessageStoreItTest, FetchAfterRespectsLimit) {
  chatlive::MariaDbNotificationSource source(db_client_);
  auto start = source.LatestSequence();
  InsertMessage("a");
  InsertMessage("b");
  auto first = source.FetchAfter(start, 1);
  ASSERT_EQ(first.size(), 1u);
  auto rest = source.FetchAfter(first[0].seq, 100);
  ASSERT_FALSE(rest.empty());
  EXPECT_GT(rest[0].seq, first[0].seq);
}

TEST_F(MessageStoreItTest, TransientFailureIsRetried) {
  auto id = InsertMessage("retry");
  auto retry_client = std::make_shared<chatlive::MariaDbClient>(TestDbConfig());
  std::atomic<std::size_t> injected{0};
  retry_client->SetTransientInjector([&injected](std::size_t attempt) {
    if (attempt == 1) {
      ++injected;
      return true;
    }
    return false;
  });
  chatlive::MariaDbMessageStore store(retry_client);
  auto message = store.FetchMessage(id);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(injected.load(), 1u);
}

TEST_F(MessageStoreItTest, SessionTokenResolvesViewerUntilExpiry) {
  const std::string token = "it-token-" + chatlive::Uuid::GenerateV7().ToString();
  const std::string expired = "it-expired-" + chatlive::Uuid::GenerateV7().ToString();
  Execute(db_client_, "INSERT INTO user_sessions (token_hash, user_id, expires_at) VALUES ('" +
                          chatlive::HashSessionToken(token) + "', '" + author_.ToString() +
                          "', UTC_TIMESTAMP(6) + INTERVAL 1 HOUR)");
  Execute(db_client_, "INSERT INTO user_sessions (token_hash, user_id, expires_at) VALUES ('" +
                          chatlive::HashSessionToken(expired) + "', '" + author_.ToString() +
                          "', UTC_TIMESTAMP(6) - INTERVAL 1 HOUR)");

  chatlive::SessionAuthenticator authenticator(db_client_);
  auto viewer = authenticator.ValidateToken(token);
  ASSERT_TRUE(viewer.has_value());
  EXPECT_EQ(viewer->user_id, author_);
  EXPECT_EQ(viewer->name, "alpha");
  EXPECT_FALSE(authenticator.ValidateToken(expired).has_value());
  EXPECT_FALSE(authenticator.ValidateToken("unknown").has_value());
  EXPECT_FALSE(authenticator.ValidateToken("").has_value());
}

}  // namespace
