/*
 * 설명: HTTP 계층이 토픽 구독을 등록하고 수신 전용 이벤트 스트림을 얻는 경계.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_engine_test.cpp, server/tests/e2e/live_stream_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "chatlive/change_event.hpp"
#include "chatlive/delivery_channel.hpp"
#include "chatlive/observability.hpp"
#include "chatlive/topic_router.hpp"
#include "chatlive/uuid.hpp"

namespace chatlive {

class SubscriptionGateway {
 public:
  SubscriptionGateway(std::shared_ptr<TopicRouter> router, std::shared_ptr<Observability> observability,
                      std::chrono::milliseconds response_timeout);

  // 실패 시 nullptr과 함께 error_code를 채운다.
  //   registration_channel_closed: 라우터가 더 이상 등록을 받지 않는다.
  //   response_not_received: 제한 시간 안에 워커가 응답하지 않았거나 응답 슬롯이 버려졌다.
  // 응답을 기다리는 동안 호출 스레드를 블록하므로 팬아웃 실행기 스레드에서 호출하면 안 된다.
  std::shared_ptr<DeliveryReceiver> Subscribe(const TopicKey& topic, const Uuid& subscriber_id,
                                              std::string& error_code, std::string& error_message);

 private:
  void RecordFailure(const TopicKey& topic, const Uuid& subscriber_id, const std::string& error_code,
                     const std::string& error_message);

  std::shared_ptr<TopicRouter> router_;
  std::shared_ptr<Observability> observability_;
  std::chrono::milliseconds response_timeout_;
};

}  // namespace chatlive
