/*
 * 설명: 토픽 하나의 구독자 집합을 단독 소유하는 팬아웃 워커. 이벤트마다 엔티티를 한 번 조회해
 *       구독자별로 렌더링/전달하고, 전달에 실패한 구독자를 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_engine_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "chatlive/bounded_inbox.hpp"
#include "chatlive/change_event.hpp"
#include "chatlive/delivery_channel.hpp"
#include "chatlive/message_store.hpp"
#include "chatlive/observability.hpp"
#include "chatlive/uuid.hpp"

namespace chatlive {

// 응답 슬롯은 한 번만 채워진다. 워커가 요청을 처리하지 못하고 사라지면 promise가 깨진다.
struct RegistrationRequest {
  TopicKey topic;
  Uuid subscriber_id;
  std::promise<std::shared_ptr<DeliveryReceiver>> response;
};

struct WorkerOptions {
  std::size_t event_inbox_capacity{1};
  std::size_t registration_inbox_capacity{1};
  // 0이면 유휴 워커를 은퇴시키지 않는다.
  std::chrono::milliseconds idle_timeout{0};
};

class FanoutWorker : public std::enable_shared_from_this<FanoutWorker> {
 public:
  using IdleCallback = std::function<void(std::shared_ptr<FanoutWorker>, std::uint64_t registrations_handled)>;

  FanoutWorker(const boost::asio::any_io_executor& executor, const TopicKey& topic,
               std::shared_ptr<MessageStore> store, std::shared_ptr<Observability> observability,
               const WorkerOptions& options, IdleCallback on_idle);

  void Start();

  // 수신함이 가득 차면 kParked를 돌려주고, 자리가 났을 때 accepted를 호출한다.
  OfferResult OfferEvent(ChangeEvent event, std::function<void()> accepted);
  OfferResult OfferRegistration(RegistrationRequest request, std::function<void()> accepted);

  // 수신함을 닫고 구독자 송신 측을 모두 해제한다. 수신 측 스트림은 종료를 보게 된다.
  void Close();

  const TopicKey& Topic() const { return topic_; }
  std::size_t SubscriberCount() const { return subscriber_count_.load(); }

 private:
  void Schedule();
  void Drain();
  bool TakeEvent();
  bool TakeRegistration();
  void HandleEvent(const ChangeEvent& event);
  void HandleRegistration(RegistrationRequest request);
  void DeliverMessage(const ChangeEvent& event);
  void DeliverToAll(const RenderedEvent& event);
  void Prune(const std::vector<Uuid>& stale, ChangeKind kind);
  void ArmIdleTimer();
  void OnIdleTimer(const boost::system::error_code& ec);
  void LogEvent(LogLevel level, const std::string& name, const std::string& message,
                std::optional<std::string> subscriber_id, std::optional<ChangeKind> kind,
                nlohmann::json detail = nullptr) const;

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  boost::asio::steady_timer idle_timer_;
  TopicKey topic_;
  std::string topic_text_;
  std::shared_ptr<MessageStore> store_;
  std::shared_ptr<Observability> observability_;
  WorkerOptions options_;
  IdleCallback on_idle_;
  BoundedInbox<ChangeEvent> events_;
  BoundedInbox<RegistrationRequest> registrations_;
  std::map<Uuid, DeliverySender> subscribers_;
  std::atomic<std::size_t> subscriber_count_{0};
  std::atomic<bool> drain_scheduled_{false};
  std::atomic<bool> closed_{false};
  std::uint64_t registrations_handled_{0};
  bool prefer_registration_{false};
};

}  // namespace chatlive
