#include <chrono>
#include <cstdlib>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <mariadb/mysql.h>
#include <nlohmann/json.hpp>

#include "chatlive/app.hpp"
#include "chatlive/auth.hpp"

namespace {

chatlive::AppConfig TestConfig(unsigned short port) {
  const char* host = std::getenv("DB_HOST");
  const char* db_port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  chatlive::AppConfig cfg{};
  cfg.port = port;
  cfg.db_host = host ? host : "127.0.0.1";
  cfg.db_port = db_port ? static_cast<unsigned short>(std::stoi(db_port)) : 3306;
  cfg.db_user = user ? user : "app";
  cfg.db_password = pass ? pass : "app_pass";
  cfg.db_name = name ? name : "app_db";
  cfg.log_level = "info";
  cfg.feed_poll_interval_ms = 50;
  cfg.feed_batch_size = 100;
  cfg.topic_event_inbox_capacity = 1;
  cfg.topic_registration_inbox_capacity = 1;
  cfg.registration_timeout_ms = 2000;
  cfg.topic_idle_timeout_seconds = 300;
  cfg.sse_keepalive_seconds = 1;
  cfg.fanout_threads = 2;
  cfg.session_cookie_name = "session";
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
}

class LiveStreamFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestConfig(18090);
    db_client_ = std::make_shared<chatlive::MariaDbClient>(chatlive::DbConfig{
        config_.db_host, config_.db_port, config_.db_user, config_.db_password, config_.db_name});
    user_ = chatlive::Uuid::GenerateV7();
    server_ = chatlive::Uuid::GenerateV7();
    channel_ = chatlive::Uuid::GenerateV7();
    token_ = "e2e-" + chatlive::Uuid::GenerateV7().ToString();
    Execute("INSERT INTO chat_users (id, name) VALUES ('" + user_.ToString() + "', 'e2e user')");
    Execute("INSERT INTO user_sessions (token_hash, user_id, expires_at) VALUES ('" +
            chatlive::HashSessionToken(token_) + "', '" + user_.ToString() + "', UTC_TIMESTAMP(6) + INTERVAL 1 HOUR)");

    app_ = std::make_unique<chatlive::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
    Execute("DELETE FROM messages WHERE channel_id = '" + channel_.ToString() + "'");
    Execute("DELETE FROM chat_users WHERE id = '" + user_.ToString() + "'");
  }

  void Execute(const std::string& sql) {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      if (mysql_query(conn, sql.c_str()) != 0) {
        db_client_->RaiseError(conn, "테스트 SQL 실패");
      }
    });
  }

  std::string StreamPath(const chatlive::Uuid& channel) const {
    return "/servers/" + server_.ToString() + "/channels/" + channel.ToString() + "/messages/events";
  }

  SimpleHttpResponse Get(const std::string& target, const std::string& cookie = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(config_.port)));

    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!cookie.empty()) {
      req.set(boost::beast::http::field::cookie, cookie);
    }
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  chatlive::AppConfig config_;
  std::shared_ptr<chatlive::MariaDbClient> db_client_;
  chatlive::Uuid user_;
  chatlive::Uuid server_;
  chatlive::Uuid channel_;
  std::string token_;
  std::unique_ptr<chatlive::ServerApp> app_;
  std::thread server_thread_;
};

// 하트비트가 keepalive 주기마다 오므로 읽기가 무한정 막히지 않는다.
class SseClient {
 public:
  SseClient(unsigned short port, const std::string& target, const std::string& cookie) : socket_(ioc_) {
    boost::asio::ip::tcp::resolver resolver{ioc_};
    boost::asio::connect(socket_, resolver.resolve("127.0.0.1", std::to_string(port)));
    std::string request = "GET " + target +
                          " HTTP/1.1\r\nHost: localhost\r\nAccept: text/event-stream\r\nCookie: " + cookie + "\r\n\r\n";
    boost::asio::write(socket_, boost::asio::buffer(request));
  }

  std::string ReadHeader() { return ReadUntil("\r\n\r\n"); }

  std::string ReadFrame() { return ReadUntil("\n\n"); }

  // 하트비트 주석은 건너뛰고 이벤트 프레임만 돌려준다.
  std::string ReadEventFrame(std::chrono::seconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      auto frame = ReadFrame();
      if (frame.rfind(":", 0) != 0) {
        return frame;
      }
    }
    return "";
  }

 private:
  std::string ReadUntil(const std::string& delimiter) {
    auto n = boost::asio::read_until(socket_, buffer_, delimiter);
    std::string data(boost::asio::buffers_begin(buffer_.data()), boost::asio::buffers_begin(buffer_.data()) + n);
    buffer_.consume(n);
    return data;
  }

  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::streambuf buffer_;
};

}  // namespace

TEST_F(LiveStreamFixture, HealthAndMetrics) {
  auto health = Get("/api/health");
  ASSERT_EQ(health.status, boost::beast::http::status::ok);
  EXPECT_TRUE(health.body["success"].get<bool>());
  EXPECT_EQ(health.body["data"]["status"], "ok");

  auto metrics = Get("/metrics");
  ASSERT_EQ(metrics.status, boost::beast::http::status::ok);
  EXPECT_TRUE(metrics.body["data"].contains("fanout"));
  EXPECT_TRUE(metrics.body["data"]["fanout"].contains("topicsActive"));
  EXPECT_GE(metrics.body["data"]["requests"]["total"].get<std::uint64_t>(), 2u);
}

TEST_F(LiveStreamFixture, StreamRequiresSession) {
  auto missing = Get(StreamPath(channel_));
  EXPECT_EQ(missing.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(missing.body, "unauthorized");

  auto unknown = Get(StreamPath(channel_), "session=not-a-real-token");
  EXPECT_EQ(unknown.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(unknown.body, "unauthorized");
}

TEST_F(LiveStreamFixture, MalformedIdsAndUnknownPaths) {
  auto bad = Get("/servers/nope/channels/" + channel_.ToString() + "/messages/events", "session=" + token_);
  EXPECT_EQ(bad.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(bad.body, "bad_request");

  auto missing = Get("/servers/" + server_.ToString() + "/channels", "session=" + token_);
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(missing.body, "not_found");
}

TEST_F(LiveStreamFixture, InsertUpdateDeleteReachOpenStream) {
  SseClient client(config_.port, StreamPath(channel_), "session=" + token_);
  auto header = client.ReadHeader();
  EXPECT_NE(header.find("200"), std::string::npos);
  EXPECT_NE(header.find("text/event-stream"), std::string::npos);
  // 등록 응답 이후에 헤더가 나가므로 이 시점 이후 변경은 스트림에 도달한다.

  auto id = chatlive::Uuid::GenerateV7();
  Execute("INSERT INTO messages (id, channel_id, author, content) VALUES ('" + id.ToString() + "', '" +
          channel_.ToString() + "', '" + user_.ToString() + "', 'hi <there>')");
  auto inserted = client.ReadEventFrame(std::chrono::seconds(5));
  EXPECT_NE(inserted.find("event: message"), std::string::npos);
  EXPECT_NE(inserted.find("id=\"msg-" + id.ToString() + "\""), std::string::npos);
  EXPECT_NE(inserted.find("chat-end"), std::string::npos);
  EXPECT_NE(inserted.find("hi &lt;there&gt;"), std::string::npos);

  Execute("UPDATE messages SET content = 'edited', updated = UTC_TIMESTAMP(6) + INTERVAL 1 SECOND WHERE id = '" +
          id.ToString() + "'");
  auto updated = client.ReadEventFrame(std::chrono::seconds(5));
  EXPECT_NE(updated.find("hx-swap-oob=\"true\""), std::string::npos);
  EXPECT_NE(updated.find("Edited"), std::string::npos);

  Execute("DELETE FROM messages WHERE id = '" + id.ToString() + "'");
  auto deleted = client.ReadEventFrame(std::chrono::seconds(5));
  EXPECT_NE(deleted.find("hx-swap-oob=\"delete\""), std::string::npos);
}

TEST_F(LiveStreamFixture, OtherChannelDoesNotReceiveEvents) {
  auto other_channel = chatlive::Uuid::GenerateV7();
  SseClient client(config_.port, StreamPath(other_channel), "session=" + token_);
  client.ReadHeader();

  auto id = chatlive::Uuid::GenerateV7();
  Execute("INSERT INTO messages (id, channel_id, author, content) VALUES ('" + id.ToString() + "', '" +
          channel_.ToString() + "', '" + user_.ToString() + "', 'elsewhere')");
  // 하트비트 두 번이 지나갈 동안 이벤트 프레임이 없어야 한다.
  auto first = client.ReadFrame();
  auto second = client.ReadFrame();
  EXPECT_EQ(first, ":heartbeat\n\n");
  EXPECT_EQ(second, ":heartbeat\n\n");
}
