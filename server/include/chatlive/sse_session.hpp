/*
 * 설명: 구독자 전달 채널을 Server-Sent Events 스트림으로 내보낸다. 주기적으로 heartbeat 주석을 보내고,
 *       클라이언트가 연결을 끊으면 수신 측을 닫아 워커가 다음 전달 때 구독자를 정리하게 한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_stream_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "chatlive/auth.hpp"
#include "chatlive/change_event.hpp"
#include "chatlive/delivery_channel.hpp"
#include "chatlive/observability.hpp"

namespace chatlive {

class SseSession : public std::enable_shared_from_this<SseSession> {
 public:
  SseSession(boost::beast::tcp_stream stream, std::shared_ptr<DeliveryReceiver> receiver, const TopicKey& topic,
             const AuthViewer& viewer, std::chrono::seconds keepalive, std::shared_ptr<Observability> observability,
             unsigned http_version, std::string trace_id);
  ~SseSession();
  void Run();

 private:
  void OnHeaderWritten(boost::beast::error_code ec);
  void ReceiveNext();
  void OnEvent(std::optional<RenderedEvent> event);
  void ScheduleKeepalive();
  void WatchDisconnect();
  void EnqueueFrame(std::string frame);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void Shutdown(const std::string& reason);

  boost::beast::tcp_stream stream_;
  boost::asio::steady_timer keepalive_timer_;
  boost::beast::http::response<boost::beast::http::empty_body> header_;
  boost::beast::http::response_serializer<boost::beast::http::empty_body> serializer_;
  std::shared_ptr<DeliveryReceiver> receiver_;
  TopicKey topic_;
  AuthViewer viewer_;
  std::chrono::seconds keepalive_;
  std::shared_ptr<Observability> observability_;
  std::string trace_id_;
  std::array<char, 512> read_buffer_{};
  std::deque<std::string> send_queue_;
  std::size_t frames_sent_{0};
  bool header_sent_{false};
  bool writing_{false};
  bool closing_{false};
};

}  // namespace chatlive
