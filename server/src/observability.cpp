/*
 * 설명: 구조화 로그 출력과 메트릭 카운터 갱신을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "chatlive/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chatlive {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "trace") {
    return LogLevel::kTrace;
  }
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kTrace:
      return "trace";
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::StreamOpened() { streams_active_.fetch_add(1); }

void Observability::StreamClosed() { streams_active_.fetch_sub(1); }

void Observability::IncrementNotification() { notifications_received_.fetch_add(1); }

void Observability::IncrementDecodeError() { decode_errors_.fetch_add(1); }

void Observability::IncrementRouteMiss() { route_misses_.fetch_add(1); }

void Observability::AddDelivered(std::uint64_t count) { events_delivered_.fetch_add(count); }

void Observability::IncrementRenderFailure() { render_failures_.fetch_add(1); }

void Observability::IncrementStoreFailure() { store_failures_.fetch_add(1); }

void Observability::AddPruned(std::uint64_t count) { subscribers_pruned_.fetch_add(count); }

void Observability::SubscriberAdded() { subscribers_active_.fetch_add(1); }

void Observability::SubscribersRemoved(std::uint64_t count) { subscribers_active_.fetch_sub(count); }

void Observability::IncrementRegistration() { registrations_.fetch_add(1); }

void Observability::IncrementRegistrationFailure() { registration_failures_.fetch_add(1); }

void Observability::SetTopicsActive(std::uint64_t count) { topics_active_.store(count); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.streams_active = streams_active_.load();
  snapshot.notifications_received = notifications_received_.load();
  snapshot.decode_errors = decode_errors_.load();
  snapshot.route_misses = route_misses_.load();
  snapshot.events_delivered = events_delivered_.load();
  snapshot.render_failures = render_failures_.load();
  snapshot.store_failures = store_failures_.load();
  snapshot.subscribers_pruned = subscribers_pruned_.load();
  snapshot.subscribers_active = subscribers_active_.load();
  snapshot.registrations = registrations_.load();
  snapshot.registration_failures = registration_failures_.load();
  snapshot.topics_active = topics_active_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["eventName"] = ctx.name;
  if (!ctx.message.empty()) {
    log_json["message"] = ctx.message;
  }
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (ctx.topic_id) {
    log_json["topicId"] = *ctx.topic_id;
  }
  if (ctx.subscriber_id) {
    log_json["subscriberId"] = *ctx.subscriber_id;
  }
  if (ctx.kind) {
    log_json["kind"] = *ctx.kind;
  }
  if (ctx.latency_ms > 0) {
    log_json["latencyMs"] = ctx.latency_ms;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << log_json.dump() << std::endl;
}

}  // namespace chatlive
