/*
 * 설명: HTTP 연결을 처리하고 헬스/메트릭 엔드포인트와 채널 메시지 이벤트 스트림 구독을 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_stream_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "chatlive/api_response.hpp"
#include "chatlive/auth.hpp"
#include "chatlive/change_event.hpp"
#include "chatlive/config.hpp"
#include "chatlive/observability.hpp"
#include "chatlive/subscription_gateway.hpp"

namespace chatlive {

// "/servers/{server}/channels/{channel}/messages/events" 경로에서 토픽을 추출한다.
// 경로 모양이 다르면 nullopt, 모양은 맞지만 id가 잘못되면 malformed를 true로 둔다.
std::optional<TopicKey> MatchEventStreamPath(const std::string& path, bool& malformed);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<SessionAuthenticator> authenticator, std::shared_ptr<SubscriptionGateway> gateway,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleEventStream(const TopicKey& topic, std::shared_ptr<Response> res);
  void SendResponse(std::shared_ptr<Response> res);
  void SendError(std::shared_ptr<Response> res, boost::beast::http::status status, std::string_view code,
                 std::string_view message);
  std::string ExtractSessionToken();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<SessionAuthenticator> authenticator_;
  std::shared_ptr<SubscriptionGateway> gateway_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace chatlive
