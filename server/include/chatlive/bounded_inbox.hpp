/*
 * 설명: 팬아웃 워커 입력용 유한 용량 수신함. 가득 차면 생산자를 대기시키고 자리가 나면 수락 콜백으로 깨운다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/bounded_inbox_test.cpp, server/tests/unit/fanout_engine_test.cpp
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace chatlive {

enum class OfferResult { kAccepted, kParked, kClosed };

template <typename T>
class BoundedInbox {
 public:
  using Accepted = std::function<void()>;

  explicit BoundedInbox(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

  BoundedInbox(const BoundedInbox&) = delete;
  BoundedInbox& operator=(const BoundedInbox&) = delete;

  // kParked이면 항목은 보관되고, 이후 Take가 자리를 비울 때 accepted가 호출된다.
  // kClosed이면 항목은 버려진다.
  OfferResult Offer(T item, Accepted accepted) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return OfferResult::kClosed;
    }
    if (items_.size() < capacity_) {
      items_.push_back(std::move(item));
      return OfferResult::kAccepted;
    }
    parked_.emplace_back(std::move(item), std::move(accepted));
    return OfferResult::kParked;
  }

  std::optional<T> Take() {
    Accepted wake;
    std::optional<T> taken;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (items_.empty()) {
        return std::nullopt;
      }
      taken.emplace(std::move(items_.front()));
      items_.pop_front();
      if (!parked_.empty()) {
        items_.push_back(std::move(parked_.front().first));
        wake = std::move(parked_.front().second);
        parked_.pop_front();
      }
    }
    if (wake) {
      wake();
    }
    return taken;
  }

  // 남은 항목을 버리고 대기 중인 생산자를 모두 깨운다. 이후 Offer는 kClosed.
  void Close() {
    std::deque<T> dropped;
    std::deque<std::pair<T, Accepted>> released;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      dropped.swap(items_);
      released.swap(parked_);
    }
    for (auto& entry : released) {
      if (entry.second) {
        entry.second();
      }
    }
  }

  bool Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  std::size_t ParkedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parked_.size();
  }

  std::size_t Capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<T> items_;
  std::deque<std::pair<T, Accepted>> parked_;
  bool closed_{false};
};

}  // namespace chatlive
