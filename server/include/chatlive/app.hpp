/*
 * 설명: 서버 전체 수명주기를 관리한다. HTTP 실행기와 팬아웃 실행기를 분리해 HTTP 스레드가
 *       등록 응답을 기다리는 동안에도 라우터와 워커는 계속 진행한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_stream_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "chatlive/auth.hpp"
#include "chatlive/change_feed.hpp"
#include "chatlive/config.hpp"
#include "chatlive/db_client.hpp"
#include "chatlive/message_store.hpp"
#include "chatlive/observability.hpp"
#include "chatlive/subscription_gateway.hpp"
#include "chatlive/topic_router.hpp"

namespace chatlive {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  std::shared_ptr<SubscriptionGateway> GetGateway() { return gateway_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::io_context fanout_ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> fanout_work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<MessageStore> message_store_;
  std::shared_ptr<SessionAuthenticator> authenticator_;
  std::shared_ptr<TopicRouter> router_;
  std::shared_ptr<SubscriptionGateway> gateway_;
  std::shared_ptr<ChangeFeedListener> feed_listener_;
  std::vector<std::thread> workers_;
  std::vector<std::thread> fanout_workers_;
  std::atomic<bool> running_{false};
};

}  // namespace chatlive
