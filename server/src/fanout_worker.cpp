/*
 * 설명: 토픽별 팬아웃 워커의 등록/이벤트 처리, 구독자 정리, 유휴 은퇴 요청을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_engine_test.cpp
 */
#include "chatlive/fanout_worker.hpp"

#include <boost/asio/post.hpp>

#include "chatlive/message_renderer.hpp"

namespace chatlive {

FanoutWorker::FanoutWorker(const boost::asio::any_io_executor& executor, const TopicKey& topic,
                           std::shared_ptr<MessageStore> store, std::shared_ptr<Observability> observability,
                           const WorkerOptions& options, IdleCallback on_idle)
    : strand_(boost::asio::make_strand(executor)), idle_timer_(strand_), topic_(topic),
      topic_text_(topic.channel_id.ToString()), store_(std::move(store)), observability_(std::move(observability)),
      options_(options), on_idle_(std::move(on_idle)), events_(options.event_inbox_capacity),
      registrations_(options.registration_inbox_capacity) {}

void FanoutWorker::Start() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() { self->ArmIdleTimer(); });
}

OfferResult FanoutWorker::OfferEvent(ChangeEvent event, std::function<void()> accepted) {
  auto result = events_.Offer(std::move(event), std::move(accepted));
  if (result != OfferResult::kClosed) {
    Schedule();
  }
  return result;
}

OfferResult FanoutWorker::OfferRegistration(RegistrationRequest request, std::function<void()> accepted) {
  auto result = registrations_.Offer(std::move(request), std::move(accepted));
  if (result != OfferResult::kClosed) {
    Schedule();
  }
  return result;
}

void FanoutWorker::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  events_.Close();
  registrations_.Close();
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    self->idle_timer_.cancel();
    auto removed = self->subscribers_.size();
    self->subscribers_.clear();
    self->subscriber_count_.store(0);
    if (removed > 0) {
      self->observability_->SubscribersRemoved(removed);
    }
    self->LogEvent(LogLevel::kDebug, "topic_worker_closed", "", std::nullopt, std::nullopt,
                   {{"subscribersReleased", removed}});
  });
}

void FanoutWorker::Schedule() {
  if (drain_scheduled_.exchange(true)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() { self->Drain(); });
}

// 한 번에 메시지 하나만 처리하고, 등록과 이벤트를 번갈아 우선한다.
void FanoutWorker::Drain() {
  drain_scheduled_.store(false);
  if (closed_) {
    return;
  }
  if (prefer_registration_) {
    if (!TakeRegistration()) {
      TakeEvent();
    }
  } else {
    if (!TakeEvent()) {
      TakeRegistration();
    }
  }
  prefer_registration_ = !prefer_registration_;
  if (!events_.Empty() || !registrations_.Empty()) {
    Schedule();
  }
}

bool FanoutWorker::TakeEvent() {
  auto event = events_.Take();
  if (!event) {
    return false;
  }
  HandleEvent(*event);
  return true;
}

bool FanoutWorker::TakeRegistration() {
  auto request = registrations_.Take();
  if (!request) {
    return false;
  }
  HandleRegistration(std::move(*request));
  return true;
}

void FanoutWorker::HandleEvent(const ChangeEvent& event) {
  switch (event.kind) {
    case ChangeKind::kInsert:
    case ChangeKind::kUpdate:
      DeliverMessage(event);
      return;
    case ChangeKind::kDelete:
      DeliverToAll(RenderDeleteEvent(event.entity_id));
      return;
  }
}

void FanoutWorker::HandleRegistration(RegistrationRequest request) {
  ++registrations_handled_;
  idle_timer_.cancel();
  auto channel = MakeDeliveryChannel();
  auto subscriber_text = request.subscriber_id.ToString();
  auto [it, inserted] = subscribers_.insert_or_assign(request.subscriber_id, std::move(channel.sender));
  if (inserted) {
    subscriber_count_.fetch_add(1);
    observability_->SubscriberAdded();
    LogEvent(LogLevel::kDebug, "subscriber_registered", "", subscriber_text, std::nullopt);
  } else {
    LogEvent(LogLevel::kInfo, "subscriber_replaced", "기존 전달 채널을 닫고 교체했습니다", subscriber_text,
             std::nullopt);
  }
  try {
    request.response.set_value(channel.receiver);
  } catch (const std::future_error& ex) {
    // 응답 슬롯을 쓸 수 없으면 엔트리는 다음 전달 실패 때 정리된다.
    LogEvent(LogLevel::kWarn, "registration_response_dropped", ex.what(), subscriber_text, std::nullopt);
  }
}

void FanoutWorker::DeliverMessage(const ChangeEvent& event) {
  std::optional<ChatMessage> message;
  try {
    message = store_->FetchMessage(event.entity_id);
  } catch (const DbException& ex) {
    observability_->IncrementStoreFailure();
    LogEvent(LogLevel::kError, "entity_fetch_failed", ex.what(), std::nullopt, event.kind,
             {{"entityId", event.entity_id.ToString()}, {"code", ex.code}, {"retryable", ex.retryable}});
    return;
  } catch (const std::exception& ex) {
    observability_->IncrementStoreFailure();
    LogEvent(LogLevel::kError, "entity_fetch_failed", ex.what(), std::nullopt, event.kind,
             {{"entityId", event.entity_id.ToString()}});
    return;
  }
  if (!message) {
    observability_->IncrementStoreFailure();
    LogEvent(LogLevel::kWarn, "entity_not_found", "변경된 메시지를 찾을 수 없습니다", std::nullopt, event.kind,
             {{"entityId", event.entity_id.ToString()}});
    return;
  }

  auto now = std::chrono::system_clock::now();
  std::vector<Uuid> stale;
  std::uint64_t delivered = 0;
  for (auto& [subscriber_id, sender] : subscribers_) {
    std::string error_code;
    std::string error_message;
    auto rendered = RenderMessageEvent(*message, event.kind, subscriber_id, topic_, now, error_code, error_message);
    if (!rendered) {
      observability_->IncrementRenderFailure();
      LogEvent(LogLevel::kWarn, "render_failed", error_message, subscriber_id.ToString(), event.kind,
               {{"code", error_code}});
      continue;
    }
    if (sender.Send(std::move(*rendered))) {
      ++delivered;
    } else {
      stale.push_back(subscriber_id);
    }
  }
  observability_->AddDelivered(delivered);
  Prune(stale, event.kind);
}

void FanoutWorker::DeliverToAll(const RenderedEvent& event) {
  std::vector<Uuid> stale;
  std::uint64_t delivered = 0;
  for (auto& [subscriber_id, sender] : subscribers_) {
    if (sender.Send(event)) {
      ++delivered;
    } else {
      stale.push_back(subscriber_id);
    }
  }
  observability_->AddDelivered(delivered);
  Prune(stale, event.kind);
}

void FanoutWorker::Prune(const std::vector<Uuid>& stale, ChangeKind kind) {
  if (stale.empty()) {
    return;
  }
  for (const auto& subscriber_id : stale) {
    subscribers_.erase(subscriber_id);
    LogEvent(LogLevel::kDebug, "subscriber_pruned", "", subscriber_id.ToString(), kind);
  }
  subscriber_count_.fetch_sub(stale.size());
  observability_->AddPruned(stale.size());
  observability_->SubscribersRemoved(stale.size());
  if (subscribers_.empty()) {
    ArmIdleTimer();
  }
}

void FanoutWorker::ArmIdleTimer() {
  if (options_.idle_timeout.count() <= 0 || closed_) {
    return;
  }
  idle_timer_.expires_after(options_.idle_timeout);
  auto self = shared_from_this();
  idle_timer_.async_wait([self](const boost::system::error_code& ec) { self->OnIdleTimer(ec); });
}

void FanoutWorker::OnIdleTimer(const boost::system::error_code& ec) {
  if (ec || closed_) {
    return;
  }
  if (!subscribers_.empty() || !events_.Empty() || !registrations_.Empty()) {
    return;
  }
  LogEvent(LogLevel::kDebug, "topic_worker_idle", "", std::nullopt, std::nullopt,
           {{"registrationsHandled", registrations_handled_}});
  if (on_idle_) {
    on_idle_(shared_from_this(), registrations_handled_);
  }
}

void FanoutWorker::LogEvent(LogLevel level, const std::string& name, const std::string& message,
                            std::optional<std::string> subscriber_id, std::optional<ChangeKind> kind,
                            nlohmann::json detail) const {
  if (!observability_->Enabled(level)) {
    return;
  }
  std::optional<std::string> kind_text;
  if (kind) {
    kind_text = std::string(ToString(*kind));
  }
  observability_->Log(LogContext{.level = level,
                                 .name = name,
                                 .message = message,
                                 .topic_id = topic_text_,
                                 .subscriber_id = std::move(subscriber_id),
                                 .kind = std::move(kind_text),
                                 .detail = std::move(detail)});
}

}  // namespace chatlive
