/*
 * 설명: message_notifications 테이블 조회와 피드 소비 루프를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/001_live_updates.sql
 * 테스트: server/tests/unit/fanout_engine_test.cpp, server/tests/it/message_store_it_test.cpp
 */
#include "chatlive/change_feed.hpp"

#include <sstream>

#include <boost/asio/post.hpp>

#include "chatlive/change_event.hpp"

namespace chatlive {

MariaDbNotificationSource::MariaDbNotificationSource(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::uint64_t MariaDbNotificationSource::LatestSequence() {
  std::uint64_t latest = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, "SELECT COALESCE(MAX(seq), 0) FROM message_notifications;") != 0) {
      db_client_->RaiseError(conn, "알림 순번 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "알림 순번 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0]) {
      latest = std::stoull(row[0]);
    }
    mysql_free_result(res);
  });
  return latest;
}

std::vector<Notification> MariaDbNotificationSource::FetchAfter(std::uint64_t seq, std::size_t limit) {
  std::vector<Notification> batch;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    batch.clear();
    std::ostringstream oss;
    oss << "SELECT seq, channel, payload FROM message_notifications WHERE seq > " << seq
        << " ORDER BY seq ASC LIMIT " << limit << ";";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "알림 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "알림 조회 결과 없음");
    }
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res))) {
      unsigned long* lengths = mysql_fetch_lengths(res);
      Notification notification;
      notification.seq = row[0] ? std::stoull(row[0]) : 0;
      notification.channel = row[1] ? std::string(row[1], lengths[1]) : std::string{};
      notification.payload = row[2] ? std::string(row[2], lengths[2]) : std::string{};
      batch.push_back(std::move(notification));
    }
    mysql_free_result(res);
  });
  return batch;
}

ChangeFeedListener::ChangeFeedListener(const boost::asio::any_io_executor& executor,
                                       std::shared_ptr<NotificationSource> source,
                                       std::shared_ptr<TopicRouter> router,
                                       std::shared_ptr<Observability> observability, const FeedOptions& options)
    : strand_(boost::asio::make_strand(executor)), timer_(strand_), source_(std::move(source)),
      router_(std::move(router)), observability_(std::move(observability)), options_(options) {}

void ChangeFeedListener::Start() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() { self->Poll(); });
}

void ChangeFeedListener::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    self->timer_.cancel();
    self->pending_.clear();
  });
}

void ChangeFeedListener::HandleNotification(const std::string& channel, const std::string& payload,
                                            std::function<void()> done) {
  observability_->IncrementNotification();
  auto result = DecodeNotification(channel, payload);
  if (!result.event) {
    observability_->IncrementDecodeError();
    observability_->Log(LogContext{.level = LogLevel::kWarn,
                                   .name = "notification_decode_failed",
                                   .message = result.reason,
                                   .detail = {{"channel", channel},
                                              {"error", std::string(ToString(result.error))},
                                              {"payloadLength", payload.size()}}});
    if (done) {
      done();
    }
    return;
  }
  router_->RouteEvent(*result.event, std::move(done));
}

void ChangeFeedListener::Poll() {
  if (stopped_) {
    return;
  }
  try {
    if (!cursor_ready_) {
      last_seq_.store(source_->LatestSequence());
      cursor_ready_ = true;
      observability_->Log(LogContext{.level = LogLevel::kInfo,
                                     .name = "change_feed_started",
                                     .detail = {{"fromSeq", last_seq_.load()}}});
    }
    auto batch = source_->FetchAfter(last_seq_.load(), options_.batch_size);
    last_batch_full_ = batch.size() >= options_.batch_size;
    for (auto& notification : batch) {
      pending_.push_back(std::move(notification));
    }
  } catch (const DbException& ex) {
    observability_->Log(LogContext{.level = LogLevel::kError,
                                   .name = "change_feed_poll_failed",
                                   .message = ex.what(),
                                   .detail = {{"code", ex.code}, {"retryable", ex.retryable}}});
    ScheduleNext(options_.poll_interval);
    return;
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{.level = LogLevel::kError, .name = "change_feed_poll_failed", .message = ex.what()});
    ScheduleNext(options_.poll_interval);
    return;
  }
  DispatchNext();
}

void ChangeFeedListener::DispatchNext() {
  if (stopped_) {
    return;
  }
  if (pending_.empty()) {
    ScheduleNext(last_batch_full_ ? std::chrono::milliseconds(0) : options_.poll_interval);
    return;
  }
  Notification next = std::move(pending_.front());
  pending_.pop_front();
  last_seq_.store(next.seq);
  auto self = shared_from_this();
  HandleNotification(next.channel, next.payload, [self]() {
    boost::asio::post(self->strand_, [self]() { self->DispatchNext(); });
  });
}

void ChangeFeedListener::ScheduleNext(std::chrono::milliseconds delay) {
  if (stopped_) {
    return;
  }
  timer_.expires_after(delay);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    self->Poll();
  });
}

}  // namespace chatlive
