/*
 * 설명: 토픽 id → 팬아웃 워커 디렉터리를 단일 strand에서 소유하고, 변경 이벤트와 구독 등록을 라우팅한다.
 *       워커 수신함이 가득 차면 라우터는 자리가 날 때까지 다음 메시지를 처리하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_engine_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <variant>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include "chatlive/change_event.hpp"
#include "chatlive/fanout_worker.hpp"
#include "chatlive/message_store.hpp"
#include "chatlive/observability.hpp"

namespace chatlive {

class TopicRouter : public std::enable_shared_from_this<TopicRouter> {
 public:
  TopicRouter(const boost::asio::any_io_executor& executor, std::shared_ptr<MessageStore> store,
              std::shared_ptr<Observability> observability, const WorkerOptions& worker_options);

  // accepted는 이벤트가 워커 수신함에 들어갔거나 버려졌을 때 한 번 호출된다.
  void RouteEvent(const ChangeEvent& event, std::function<void()> accepted);

  // 라우터가 닫혔으면 false를 돌려주고 요청은 버려진다.
  bool RouteRegistration(RegistrationRequest request);

  void Close();
  bool Closed() const { return closed_.load(); }

  std::size_t ActiveTopics() const { return active_topics_.load(); }

 private:
  struct EventMessage {
    ChangeEvent event;
    std::function<void()> accepted;
  };
  struct RetireMessage {
    std::shared_ptr<FanoutWorker> worker;
    std::uint64_t registrations_handled;
  };
  using Message = std::variant<EventMessage, RegistrationRequest, RetireMessage>;

  struct DirectoryEntry {
    std::shared_ptr<FanoutWorker> worker;
    std::uint64_t registrations_forwarded{0};
  };

  void Enqueue(Message message);
  void Pump();
  void Handle(EventMessage message);
  void Handle(RegistrationRequest request);
  void Handle(RetireMessage message);
  void Resume();
  DirectoryEntry& SpawnWorker(const TopicKey& topic);
  void PublishTopicCount();

  boost::asio::any_io_executor executor_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  std::shared_ptr<MessageStore> store_;
  std::shared_ptr<Observability> observability_;
  WorkerOptions worker_options_;
  std::map<Uuid, DirectoryEntry> directory_;
  std::deque<Message> mailbox_;
  bool suspended_{false};
  std::atomic<bool> closed_{false};
  std::atomic<std::size_t> active_topics_{0};
};

}  // namespace chatlive
