/*
 * 설명: 저장소 변경 알림 피드를 단일 소비자로 읽어 디코드하고 라우터로 넘긴다.
 *       라우터가 이전 이벤트를 수락해야 다음 알림을 넘기므로 백프레셔가 피드까지 전파된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/001_live_updates.sql
 * 테스트: server/tests/unit/fanout_engine_test.cpp, server/tests/it/message_store_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "chatlive/db_client.hpp"
#include "chatlive/observability.hpp"
#include "chatlive/topic_router.hpp"

namespace chatlive {

struct Notification {
  std::uint64_t seq;
  std::string channel;
  std::string payload;
};

// 오류는 DbException으로 던진다.
class NotificationSource {
 public:
  virtual ~NotificationSource() = default;
  virtual std::uint64_t LatestSequence() = 0;
  virtual std::vector<Notification> FetchAfter(std::uint64_t seq, std::size_t limit) = 0;
};

// 트리거가 채우는 message_notifications 테이블을 순번 순서로 읽는다.
class MariaDbNotificationSource : public NotificationSource {
 public:
  explicit MariaDbNotificationSource(std::shared_ptr<MariaDbClient> db_client);

  std::uint64_t LatestSequence() override;
  std::vector<Notification> FetchAfter(std::uint64_t seq, std::size_t limit) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

struct FeedOptions {
  std::chrono::milliseconds poll_interval{100};
  std::size_t batch_size{100};
};

class ChangeFeedListener : public std::enable_shared_from_this<ChangeFeedListener> {
 public:
  ChangeFeedListener(const boost::asio::any_io_executor& executor, std::shared_ptr<NotificationSource> source,
                     std::shared_ptr<TopicRouter> router, std::shared_ptr<Observability> observability,
                     const FeedOptions& options);

  // 시작 시점의 최신 순번 이후만 소비한다. 과거 알림은 재생하지 않는다.
  void Start();
  void Stop();

  // 알림 하나를 디코드해 라우팅한다. done은 라우터가 수락했거나 알림이 버려졌을 때 호출된다.
  void HandleNotification(const std::string& channel, const std::string& payload, std::function<void()> done);

  std::uint64_t LastSequence() const { return last_seq_.load(); }

 private:
  void Poll();
  void DispatchNext();
  void ScheduleNext(std::chrono::milliseconds delay);

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  boost::asio::steady_timer timer_;
  std::shared_ptr<NotificationSource> source_;
  std::shared_ptr<TopicRouter> router_;
  std::shared_ptr<Observability> observability_;
  FeedOptions options_;
  std::deque<Notification> pending_;
  std::atomic<std::uint64_t> last_seq_{0};
  bool cursor_ready_{false};
  bool last_batch_full_{false};
  std::atomic<bool> stopped_{false};
};

}  // namespace chatlive
