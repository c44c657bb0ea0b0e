/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭/이벤트 스트림 구독을 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_stream_test.cpp
 */
#include "chatlive/http_session.hpp"

#include <vector>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "chatlive/sse_session.hpp"

namespace chatlive {

namespace {
std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    auto slash = path.find('/', pos);
    auto segment = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}
}  // namespace

std::optional<TopicKey> MatchEventStreamPath(const std::string& path, bool& malformed) {
  malformed = false;
  auto segments = SplitPath(path);
  if (segments.size() != 6 || segments[0] != "servers" || segments[2] != "channels" || segments[4] != "messages" ||
      segments[5] != "events") {
    return std::nullopt;
  }
  auto server_id = Uuid::Parse(segments[1]);
  auto channel_id = Uuid::Parse(segments[3]);
  if (!server_id || !channel_id) {
    malformed = true;
    return std::nullopt;
  }
  return TopicKey{*channel_id, *server_id};
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<SessionAuthenticator> authenticator,
                         std::shared_ptr<SubscriptionGateway> gateway, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), authenticator_(std::move(authenticator)),
      gateway_(std::move(gateway)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) { self->OnRead(ec, bytes_transferred); });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "chatlive");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    auto body = MakeSuccessEnvelope(payload).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{
        {"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
        {"streams", {{"active", snapshot.streams_active}}},
        {"feed",
         {{"notifications", snapshot.notifications_received},
          {"decodeErrors", snapshot.decode_errors},
          {"routeMisses", snapshot.route_misses}}},
        {"fanout",
         {{"topicsActive", snapshot.topics_active},
          {"subscribersActive", snapshot.subscribers_active},
          {"eventsDelivered", snapshot.events_delivered},
          {"renderFailures", snapshot.render_failures},
          {"storeFailures", snapshot.store_failures},
          {"subscribersPruned", snapshot.subscribers_pruned}}},
        {"registrations", {{"total", snapshot.registrations}, {"failures", snapshot.registration_failures}}}};
    auto body = MakeSuccessEnvelope(data).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  bool malformed = false;
  auto topic = MatchEventStreamPath(path, malformed);
  if (req_.method() == http::verb::get && (topic || malformed)) {
    if (malformed) {
      return SendError(res, http::status::bad_request, "bad_request", "서버 또는 채널 id가 올바르지 않습니다");
    }
    return HandleEventStream(*topic, res);
  }

  SendError(res, http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::HandleEventStream(const TopicKey& topic, std::shared_ptr<Response> res) {
  using namespace boost::beast;
  std::optional<AuthViewer> viewer;
  try {
    viewer = authenticator_->ValidateToken(ExtractSessionToken());
  } catch (const DbException& ex) {
    observability_->Log(LogContext{.level = LogLevel::kError,
                                   .name = "session_lookup_failed",
                                   .message = ex.what(),
                                   .trace_id = trace_id_,
                                   .detail = {{"code", ex.code}, {"retryable", ex.retryable}}});
    return SendError(res, http::status::service_unavailable, "auth_unavailable", "세션을 확인할 수 없습니다");
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{
        .level = LogLevel::kError, .name = "session_lookup_failed", .message = ex.what(), .trace_id = trace_id_});
    return SendError(res, http::status::service_unavailable, "auth_unavailable", "세션을 확인할 수 없습니다");
  }
  if (!viewer) {
    return SendError(res, http::status::unauthorized, "unauthorized", "인증이 필요합니다");
  }

  std::string error_code;
  std::string error_message;
  auto receiver = gateway_->Subscribe(topic, viewer->user_id, error_code, error_message);
  if (!receiver) {
    observability_->Log(LogContext{.level = LogLevel::kWarn,
                                   .name = "live_updates_unavailable",
                                   .message = error_message,
                                   .trace_id = trace_id_,
                                   .topic_id = topic.channel_id.ToString(),
                                   .subscriber_id = viewer->user_id.ToString(),
                                   .detail = {{"code", error_code}}});
    return SendError(res, http::status::service_unavailable, "live_updates_unavailable",
                     "실시간 업데이트를 사용할 수 없습니다");
  }

  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_);
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .name = "http_request",
                                 .message = std::string(req_.target()),
                                 .trace_id = trace_id_,
                                 .latency_ms = static_cast<long>(latency.count()),
                                 .detail = {{"status", 200}}});
  std::make_shared<SseSession>(std::move(stream_), std::move(receiver), topic, *viewer,
                               std::chrono::seconds(config_.sse_keepalive_seconds), observability_, req_.version(),
                               trace_id_)
      ->Run();
}

void HttpSession::SendError(std::shared_ptr<Response> res, boost::beast::http::status status, std::string_view code,
                            std::string_view message) {
  res->result(status);
  auto body = MakeErrorEnvelope(code, message).dump();
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
          .count();
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .name = "http_request",
                                 .message = std::string(req_.target()),
                                 .trace_id = trace_id_,
                                 .latency_ms = static_cast<long>(latency),
                                 .detail = {{"status", res->result_int()}}});
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

std::string HttpSession::ExtractSessionToken() {
  auto cookie_it = req_.find(boost::beast::http::field::cookie);
  if (cookie_it != req_.end()) {
    auto token = FindCookie(std::string(cookie_it->value()), config_.session_cookie_name);
    if (!token.empty()) {
      return token;
    }
  }
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it == req_.end()) {
    return "";
  }
  return ParseBearer(std::string(auth_it->value()));
}

}  // namespace chatlive
