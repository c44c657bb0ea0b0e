/*
 * 설명: 구독자별 전달 채널의 송수신과 종료 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/delivery_channel_test.cpp
 */
#include "chatlive/delivery_channel.hpp"

#include <boost/asio/post.hpp>

namespace chatlive {
namespace {
using Handler = std::function<void(std::optional<RenderedEvent>)>;

void Dispatch(const boost::asio::any_io_executor& executor, Handler handler, std::optional<RenderedEvent> event) {
  boost::asio::post(executor, [handler = std::move(handler), event = std::move(event)]() mutable {
    handler(std::move(event));
  });
}
}  // namespace

DeliverySender& DeliverySender::operator=(DeliverySender&& other) noexcept {
  if (this != &other) {
    Close();
    state_ = std::move(other.state_);
  }
  return *this;
}

DeliverySender::~DeliverySender() { Close(); }

bool DeliverySender::Send(RenderedEvent event) {
  if (!state_) {
    return false;
  }
  Handler handler;
  std::optional<boost::asio::any_io_executor> executor;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->receiver_closed) {
      return false;
    }
    if (state_->waiter) {
      handler = std::move(state_->waiter);
      executor = std::move(state_->waiter_executor);
      state_->waiter = nullptr;
      state_->waiter_executor.reset();
    } else {
      state_->queue.push_back(std::move(event));
    }
  }
  if (handler) {
    Dispatch(*executor, std::move(handler), std::move(event));
  } else {
    state_->cv.notify_all();
  }
  return true;
}

void DeliverySender::Close() {
  if (!state_) {
    return;
  }
  Handler handler;
  std::optional<boost::asio::any_io_executor> executor;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->sender_closed = true;
    if (state_->waiter) {
      handler = std::move(state_->waiter);
      executor = std::move(state_->waiter_executor);
      state_->waiter = nullptr;
      state_->waiter_executor.reset();
    }
  }
  state_->cv.notify_all();
  if (handler) {
    Dispatch(*executor, std::move(handler), std::nullopt);
  }
  state_.reset();
}

DeliveryReceiver::~DeliveryReceiver() { Close(); }

void DeliveryReceiver::AsyncReceive(const boost::asio::any_io_executor& executor, Handler handler) {
  std::optional<RenderedEvent> ready;
  bool finished = false;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->queue.empty()) {
      ready.emplace(std::move(state_->queue.front()));
      state_->queue.pop_front();
    } else if (state_->sender_closed || state_->receiver_closed) {
      finished = true;
    } else {
      state_->waiter = std::move(handler);
      state_->waiter_executor = executor;
      return;
    }
  }
  if (ready || finished) {
    Dispatch(executor, std::move(handler), std::move(ready));
  }
}

std::optional<RenderedEvent> DeliveryReceiver::TryReceive() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->queue.empty()) {
    return std::nullopt;
  }
  RenderedEvent event = std::move(state_->queue.front());
  state_->queue.pop_front();
  return event;
}

std::optional<RenderedEvent> DeliveryReceiver::ReceiveFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->cv.wait_for(lock, timeout, [this]() { return !state_->queue.empty() || state_->sender_closed; });
  if (state_->queue.empty()) {
    return std::nullopt;
  }
  RenderedEvent event = std::move(state_->queue.front());
  state_->queue.pop_front();
  return event;
}

bool DeliveryReceiver::Finished() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->sender_closed && state_->queue.empty();
}

void DeliveryReceiver::Close() {
  Handler dropped;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->receiver_closed = true;
    state_->queue.clear();
    // 대기 핸들러가 세션을 붙잡고 있으므로 호출하지 않고 놓아준다.
    dropped = std::move(state_->waiter);
    state_->waiter = nullptr;
    state_->waiter_executor.reset();
  }
}

DeliveryChannel MakeDeliveryChannel() {
  auto state = std::make_shared<detail::DeliveryState>();
  return DeliveryChannel{DeliverySender(state), std::make_shared<DeliveryReceiver>(state)};
}

}  // namespace chatlive
