/*
 * 설명: 구조화 로그와 팬아웃 엔진/HTTP 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_engine_test.cpp, server/tests/e2e/live_stream_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatlive {

enum class LogLevel { kTrace, kDebug, kInfo, kWarn, kError };

LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::string message;
  std::string trace_id;
  std::optional<std::string> topic_id;
  std::optional<std::string> subscriber_id;
  std::optional<std::string> kind;
  long latency_ms{0};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t streams_active{0};
  std::uint64_t notifications_received{0};
  std::uint64_t decode_errors{0};
  std::uint64_t route_misses{0};
  std::uint64_t events_delivered{0};
  std::uint64_t render_failures{0};
  std::uint64_t store_failures{0};
  std::uint64_t subscribers_pruned{0};
  std::uint64_t subscribers_active{0};
  std::uint64_t registrations{0};
  std::uint64_t registration_failures{0};
  std::uint64_t topics_active{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void StreamOpened();
  void StreamClosed();

  void IncrementNotification();
  void IncrementDecodeError();
  void IncrementRouteMiss();
  void AddDelivered(std::uint64_t count);
  void IncrementRenderFailure();
  void IncrementStoreFailure();
  void AddPruned(std::uint64_t count);
  void SubscriberAdded();
  void SubscribersRemoved(std::uint64_t count);
  void IncrementRegistration();
  void IncrementRegistrationFailure();
  void SetTopicsActive(std::uint64_t count);

  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> streams_active_{0};
  std::atomic<std::uint64_t> notifications_received_{0};
  std::atomic<std::uint64_t> decode_errors_{0};
  std::atomic<std::uint64_t> route_misses_{0};
  std::atomic<std::uint64_t> events_delivered_{0};
  std::atomic<std::uint64_t> render_failures_{0};
  std::atomic<std::uint64_t> store_failures_{0};
  std::atomic<std::uint64_t> subscribers_pruned_{0};
  std::atomic<std::uint64_t> subscribers_active_{0};
  std::atomic<std::uint64_t> registrations_{0};
  std::atomic<std::uint64_t> registration_failures_{0};
  std::atomic<std::uint64_t> topics_active_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace chatlive
