/*
 * 설명: 구독자별 무제한 전달 채널. 송신 측은 팬아웃 워커만, 수신 측은 스트림 세션만 사용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/delivery_channel_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/any_io_executor.hpp>

#include "chatlive/change_event.hpp"
#include "chatlive/uuid.hpp"

namespace chatlive {

struct RenderedEvent {
  ChangeKind kind;
  Uuid message_id;
  std::string html;

  std::string_view Tag() const { return ToString(kind); }
  // 삭제 대상이자 교체 대상 요소의 DOM id
  std::string ElementId() const { return "msg-" + message_id.ToString(); }
};

namespace detail {
struct DeliveryState {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<RenderedEvent> queue;
  bool sender_closed{false};
  bool receiver_closed{false};
  std::optional<boost::asio::any_io_executor> waiter_executor;
  std::function<void(std::optional<RenderedEvent>)> waiter;
};
}  // namespace detail

class DeliverySender {
 public:
  DeliverySender() = default;
  explicit DeliverySender(std::shared_ptr<detail::DeliveryState> state) : state_(std::move(state)) {}
  DeliverySender(DeliverySender&& other) noexcept = default;
  DeliverySender& operator=(DeliverySender&& other) noexcept;
  DeliverySender(const DeliverySender&) = delete;
  DeliverySender& operator=(const DeliverySender&) = delete;
  ~DeliverySender();

  // 수신 측이 닫혔으면 false. 절대 블록하지 않는다.
  bool Send(RenderedEvent event);

 private:
  void Close();

  std::shared_ptr<detail::DeliveryState> state_;
};

class DeliveryReceiver {
 public:
  explicit DeliveryReceiver(std::shared_ptr<detail::DeliveryState> state) : state_(std::move(state)) {}
  DeliveryReceiver(const DeliveryReceiver&) = delete;
  DeliveryReceiver& operator=(const DeliveryReceiver&) = delete;
  ~DeliveryReceiver();

  // 다음 이벤트를 executor에서 handler로 전달한다. 송신 측이 사라져 스트림이 끝나면 nullopt.
  // 동시에 하나의 대기만 허용한다.
  void AsyncReceive(const boost::asio::any_io_executor& executor,
                    std::function<void(std::optional<RenderedEvent>)> handler);

  std::optional<RenderedEvent> TryReceive();
  std::optional<RenderedEvent> ReceiveFor(std::chrono::milliseconds timeout);

  // 송신 측이 닫혔고 남은 이벤트도 없다.
  bool Finished() const;

  void Close();

 private:
  std::shared_ptr<detail::DeliveryState> state_;
};

struct DeliveryChannel {
  DeliverySender sender;
  std::shared_ptr<DeliveryReceiver> receiver;
};

DeliveryChannel MakeDeliveryChannel();

}  // namespace chatlive
