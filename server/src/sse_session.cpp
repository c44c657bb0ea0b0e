/*
 * 설명: SSE 헤더 전송, 이벤트/heartbeat 프레임 큐, 연결 종료 감지를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_stream_test.cpp
 */
#include "chatlive/sse_session.hpp"

#include <boost/asio/write.hpp>

#include "chatlive/api_response.hpp"

namespace chatlive {

namespace {
// 모든 렌더링 결과는 같은 SSE 이벤트 이름으로 나간다. 종류는 HTML 안의 swap 속성이 구분한다.
constexpr const char* kSseEventName = "message";
}  // namespace

SseSession::SseSession(boost::beast::tcp_stream stream, std::shared_ptr<DeliveryReceiver> receiver,
                       const TopicKey& topic, const AuthViewer& viewer, std::chrono::seconds keepalive,
                       std::shared_ptr<Observability> observability, unsigned http_version, std::string trace_id)
    : stream_(std::move(stream)), keepalive_timer_(stream_.get_executor()), header_(), serializer_(header_),
      receiver_(std::move(receiver)), topic_(topic), viewer_(viewer), keepalive_(keepalive),
      observability_(std::move(observability)), trace_id_(std::move(trace_id)) {
  header_.version(http_version);
  header_.result(boost::beast::http::status::ok);
  header_.set(boost::beast::http::field::server, "chatlive");
  header_.set(boost::beast::http::field::content_type, "text/event-stream");
  header_.set(boost::beast::http::field::cache_control, "no-cache");
  // 본문 길이를 알 수 없으므로 연결 종료로 스트림 끝을 표시한다.
  header_.keep_alive(false);
}

SseSession::~SseSession() { observability_->StreamClosed(); }

void SseSession::Run() {
  observability_->StreamOpened();
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .name = "stream_opened",
                                 .trace_id = trace_id_,
                                 .topic_id = topic_.channel_id.ToString(),
                                 .subscriber_id = viewer_.user_id.ToString()});
  stream_.expires_never();
  auto self = shared_from_this();
  boost::beast::http::async_write_header(stream_, serializer_,
                                         [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                           self->OnHeaderWritten(ec);
                                         });
}

void SseSession::OnHeaderWritten(boost::beast::error_code ec) {
  if (ec) {
    return Shutdown("header_write_failed");
  }
  header_sent_ = true;
  ReceiveNext();
  ScheduleKeepalive();
  WatchDisconnect();
  WriteNext();
}

void SseSession::ReceiveNext() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  receiver_->AsyncReceive(stream_.get_executor(),
                          [self](std::optional<RenderedEvent> event) { self->OnEvent(std::move(event)); });
}

void SseSession::OnEvent(std::optional<RenderedEvent> event) {
  if (closing_) {
    return;
  }
  if (!event) {
    return Shutdown("delivery_closed");
  }
  EnqueueFrame(ToSseFrame(kSseEventName, event->html));
  ReceiveNext();
}

void SseSession::ScheduleKeepalive() {
  if (closing_ || keepalive_.count() <= 0) {
    return;
  }
  keepalive_timer_.expires_after(keepalive_);
  auto self = shared_from_this();
  keepalive_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec || self->closing_) {
      return;
    }
    self->EnqueueFrame(ToSseComment("heartbeat"));
    self->ScheduleKeepalive();
  });
}

// 클라이언트는 스트림에 쓰지 않는다. 읽기가 끝나면 연결이 끊어진 것이다.
void SseSession::WatchDisconnect() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  stream_.socket().async_read_some(boost::asio::buffer(read_buffer_),
                                   [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                     if (ec) {
                                       return self->Shutdown("client_disconnected");
                                     }
                                     self->WatchDisconnect();
                                   });
}

void SseSession::EnqueueFrame(std::string frame) {
  if (closing_) {
    return;
  }
  send_queue_.push_back(std::move(frame));
  if (!writing_ && header_sent_) {
    WriteNext();
  }
}

void SseSession::WriteNext() {
  if (send_queue_.empty() || closing_ || writing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  boost::asio::async_write(stream_, boost::asio::buffer(send_queue_.front()),
                           [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                             self->OnWrite(ec);
                           });
}

void SseSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    return Shutdown("write_failed");
  }
  ++frames_sent_;
  WriteNext();
}

void SseSession::Shutdown(const std::string& reason) {
  if (closing_) {
    return;
  }
  closing_ = true;
  // 진행 중인 쓰기는 맨 앞 버퍼를 참조하므로 완료 핸들러가 비울 때까지 남겨 둔다.
  if (!writing_) {
    send_queue_.clear();
  }
  keepalive_timer_.cancel();
  receiver_->Close();
  boost::beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  stream_.socket().close(ec);
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .name = "stream_closed",
                                 .message = reason,
                                 .trace_id = trace_id_,
                                 .topic_id = topic_.channel_id.ToString(),
                                 .subscriber_id = viewer_.user_id.ToString(),
                                 .detail = {{"framesSent", frames_sent_}}});
}

}  // namespace chatlive
