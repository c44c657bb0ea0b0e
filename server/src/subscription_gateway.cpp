/*
 * 설명: 등록 요청을 라우터에 제출하고 일회성 응답을 제한 시간 동안 기다린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_engine_test.cpp, server/tests/e2e/live_stream_test.cpp
 */
#include "chatlive/subscription_gateway.hpp"

#include <future>

namespace chatlive {

SubscriptionGateway::SubscriptionGateway(std::shared_ptr<TopicRouter> router,
                                         std::shared_ptr<Observability> observability,
                                         std::chrono::milliseconds response_timeout)
    : router_(std::move(router)), observability_(std::move(observability)), response_timeout_(response_timeout) {}

std::shared_ptr<DeliveryReceiver> SubscriptionGateway::Subscribe(const TopicKey& topic, const Uuid& subscriber_id,
                                                                 std::string& error_code,
                                                                 std::string& error_message) {
  auto started = std::chrono::steady_clock::now();
  RegistrationRequest request{topic, subscriber_id, {}};
  auto response = request.response.get_future();
  if (!router_->RouteRegistration(std::move(request))) {
    error_code = "registration_channel_closed";
    error_message = "라우터가 등록을 받지 않습니다";
    RecordFailure(topic, subscriber_id, error_code, error_message);
    return nullptr;
  }

  if (response.wait_for(response_timeout_) != std::future_status::ready) {
    error_code = "response_not_received";
    error_message = "제한 시간 안에 등록 응답을 받지 못했습니다";
    RecordFailure(topic, subscriber_id, error_code, error_message);
    return nullptr;
  }

  std::shared_ptr<DeliveryReceiver> receiver;
  try {
    receiver = response.get();
  } catch (const std::future_error& ex) {
    error_code = "response_not_received";
    error_message = std::string("등록 응답 슬롯이 버려졌습니다: ") + ex.what();
    RecordFailure(topic, subscriber_id, error_code, error_message);
    return nullptr;
  }

  observability_->IncrementRegistration();
  auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  observability_->Log(LogContext{.level = LogLevel::kDebug,
                                 .name = "subscription_registered",
                                 .topic_id = topic.channel_id.ToString(),
                                 .subscriber_id = subscriber_id.ToString(),
                                 .latency_ms = static_cast<long>(latency.count())});
  return receiver;
}

void SubscriptionGateway::RecordFailure(const TopicKey& topic, const Uuid& subscriber_id,
                                        const std::string& error_code, const std::string& error_message) {
  observability_->IncrementRegistrationFailure();
  observability_->Log(LogContext{.level = LogLevel::kWarn,
                                 .name = "subscription_failed",
                                 .message = error_message,
                                 .topic_id = topic.channel_id.ToString(),
                                 .subscriber_id = subscriber_id.ToString(),
                                 .detail = {{"code", error_code}}});
}

}  // namespace chatlive
