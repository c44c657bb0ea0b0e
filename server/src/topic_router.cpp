/*
 * 설명: 토픽 디렉터리의 라우팅, 워커 지연 생성, 유휴 워커 은퇴와 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_engine_test.cpp
 */
#include "chatlive/topic_router.hpp"

#include <boost/asio/post.hpp>

namespace chatlive {

TopicRouter::TopicRouter(const boost::asio::any_io_executor& executor, std::shared_ptr<MessageStore> store,
                         std::shared_ptr<Observability> observability, const WorkerOptions& worker_options)
    : executor_(executor), strand_(boost::asio::make_strand(executor)), store_(std::move(store)),
      observability_(std::move(observability)), worker_options_(worker_options) {}

void TopicRouter::RouteEvent(const ChangeEvent& event, std::function<void()> accepted) {
  if (closed_) {
    if (accepted) {
      accepted();
    }
    return;
  }
  Enqueue(EventMessage{event, std::move(accepted)});
}

bool TopicRouter::RouteRegistration(RegistrationRequest request) {
  if (closed_) {
    return false;
  }
  Enqueue(std::move(request));
  return true;
}

void TopicRouter::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    for (auto& [topic_id, entry] : self->directory_) {
      entry.worker->Close();
    }
    self->directory_.clear();
    auto pending = std::move(self->mailbox_);
    self->mailbox_.clear();
    for (auto& message : pending) {
      if (auto* event = std::get_if<EventMessage>(&message); event && event->accepted) {
        event->accepted();
      }
    }
    self->PublishTopicCount();
    self->observability_->Log(LogContext{.level = LogLevel::kInfo, .name = "topic_router_closed"});
  });
}

void TopicRouter::Enqueue(Message message) {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self, message = std::move(message)]() mutable {
    if (self->closed_) {
      // 등록 요청은 여기서 소멸되며 대기 중인 호출자는 응답 없음으로 끝난다.
      if (auto* event = std::get_if<EventMessage>(&message); event && event->accepted) {
        event->accepted();
      }
      return;
    }
    self->mailbox_.push_back(std::move(message));
    self->Pump();
  });
}

void TopicRouter::Pump() {
  while (!suspended_ && !mailbox_.empty() && !closed_) {
    Message message = std::move(mailbox_.front());
    mailbox_.pop_front();
    std::visit([this](auto&& item) { Handle(std::move(item)); }, std::move(message));
  }
}

void TopicRouter::Resume() {
  suspended_ = false;
  Pump();
}

void TopicRouter::Handle(EventMessage message) {
  auto it = directory_.find(message.event.topic_id);
  if (it == directory_.end()) {
    observability_->IncrementRouteMiss();
    if (observability_->Enabled(LogLevel::kTrace)) {
      observability_->Log(LogContext{.level = LogLevel::kTrace,
                                     .name = "route_miss",
                                     .message = "구독자가 없는 토픽의 이벤트를 버립니다",
                                     .topic_id = message.event.topic_id.ToString(),
                                     .kind = std::string(ToString(message.event.kind)),
                                     .detail = {{"entityId", message.event.entity_id.ToString()}}});
    }
    if (message.accepted) {
      message.accepted();
    }
    return;
  }

  auto self = shared_from_this();
  auto accepted = message.accepted;
  auto result = it->second.worker->OfferEvent(message.event, [self, accepted]() {
    boost::asio::post(self->strand_, [self, accepted]() {
      if (accepted) {
        accepted();
      }
      self->Resume();
    });
  });
  if (result == OfferResult::kParked) {
    suspended_ = true;
    return;
  }
  if (accepted) {
    accepted();
  }
}

void TopicRouter::Handle(RegistrationRequest request) {
  auto it = directory_.find(request.topic.channel_id);
  DirectoryEntry& entry = it == directory_.end() ? SpawnWorker(request.topic) : it->second;
  ++entry.registrations_forwarded;
  auto self = shared_from_this();
  auto result = entry.worker->OfferRegistration(std::move(request), [self]() {
    boost::asio::post(self->strand_, [self]() { self->Resume(); });
  });
  if (result == OfferResult::kParked) {
    suspended_ = true;
  }
}

// 워커가 유휴를 보고한 뒤 새 등록이 전달됐다면 은퇴시키지 않는다.
void TopicRouter::Handle(RetireMessage message) {
  const auto& topic = message.worker->Topic();
  auto it = directory_.find(topic.channel_id);
  if (it == directory_.end() || it->second.worker != message.worker ||
      it->second.registrations_forwarded != message.registrations_handled) {
    observability_->Log(LogContext{.level = LogLevel::kDebug,
                                   .name = "topic_worker_retire_skipped",
                                   .topic_id = topic.channel_id.ToString()});
    return;
  }
  directory_.erase(it);
  message.worker->Close();
  PublishTopicCount();
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .name = "topic_worker_retired",
                                 .topic_id = topic.channel_id.ToString(),
                                 .detail = {{"registrationsHandled", message.registrations_handled}}});
}

TopicRouter::DirectoryEntry& TopicRouter::SpawnWorker(const TopicKey& topic) {
  std::weak_ptr<TopicRouter> weak = weak_from_this();
  auto worker = std::make_shared<FanoutWorker>(
      executor_, topic, store_, observability_, worker_options_,
      [weak](std::shared_ptr<FanoutWorker> idle_worker, std::uint64_t registrations_handled) {
        if (auto self = weak.lock()) {
          self->Enqueue(RetireMessage{std::move(idle_worker), registrations_handled});
        }
      });
  worker->Start();
  auto [it, inserted] = directory_.emplace(topic.channel_id, DirectoryEntry{worker, 0});
  PublishTopicCount();
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .name = "topic_worker_spawned",
                                 .topic_id = topic.channel_id.ToString(),
                                 .detail = {{"serverId", topic.server_id.ToString()}}});
  return it->second;
}

void TopicRouter::PublishTopicCount() {
  active_topics_.store(directory_.size());
  observability_->SetTopicsActive(directory_.size());
}

}  // namespace chatlive
