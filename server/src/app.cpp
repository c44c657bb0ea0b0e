/*
 * 설명: 서버 수명주기, 리스닝, 팬아웃 실행기 스레드와 환경설정 로딩을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_stream_test.cpp
 */
#include "chatlive/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "chatlive/http_session.hpp"

namespace chatlive {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<SessionAuthenticator> authenticator, std::shared_ptr<SubscriptionGateway> gateway,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), authenticator_(std::move(authenticator)),
        gateway_(std::move(gateway)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->authenticator_, self->gateway_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<SessionAuthenticator> authenticator_;
  std::shared_ptr<SubscriptionGateway> gateway_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)),
      fanout_ioc_(static_cast<int>(std::max<std::size_t>(1, config.fanout_threads))),
      fanout_work_guard_(boost::asio::make_work_guard(fanout_ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  message_store_ = std::make_shared<MariaDbMessageStore>(db_client_);
  authenticator_ = std::make_shared<SessionAuthenticator>(db_client_);

  WorkerOptions worker_options;
  worker_options.event_inbox_capacity = config.topic_event_inbox_capacity;
  worker_options.registration_inbox_capacity = config.topic_registration_inbox_capacity;
  worker_options.idle_timeout = std::chrono::seconds(config.topic_idle_timeout_seconds);
  router_ = std::make_shared<TopicRouter>(fanout_ioc_.get_executor(), message_store_, observability_, worker_options);
  gateway_ = std::make_shared<SubscriptionGateway>(router_, observability_,
                                                   std::chrono::milliseconds(config.registration_timeout_ms));

  FeedOptions feed_options;
  feed_options.poll_interval = std::chrono::milliseconds(config.feed_poll_interval_ms);
  feed_options.batch_size = std::max<std::size_t>(1, config.feed_batch_size);
  feed_listener_ = std::make_shared<ChangeFeedListener>(
      fanout_ioc_.get_executor(), std::make_shared<MariaDbNotificationSource>(db_client_), router_, observability_,
      feed_options);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    for (std::size_t i = 0; i < std::max<std::size_t>(1, config_.fanout_threads); ++i) {
      fanout_workers_.emplace_back([this]() { fanout_ioc_.run(); });
    }
    feed_listener_->Start();
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, authenticator_, gateway_, observability_);
    listener_->Run();
    observability_->Log(LogContext{.level = LogLevel::kInfo,
                                   .name = "server_started",
                                   .message = "서버 시작: 포트 " + std::to_string(config_.port),
                                   .detail = {{"fanoutThreads", config_.fanout_threads}}});
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Log(LogContext{.level = LogLevel::kInfo,
                                     .name = "server_stopping",
                                     .detail = {{"signal", signal_number}}});
      ioc_.stop();
    });
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(2u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (listener_) {
    listener_->Stop();
  }
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  // 닫기 작업은 팬아웃 strand에 게시되므로 실행기를 멈추지 않고 남은 작업을 모두 처리시킨다.
  router_->Close();
  feed_listener_->Stop();
  fanout_work_guard_.reset();
  for (auto& worker : fanout_workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  fanout_ioc_.stop();
  observability_->Log(LogContext{.level = LogLevel::kInfo, .name = "server_stopped"});
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&get_env](const char* key, const char* def) {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.feed_poll_interval_ms = get_size("FEED_POLL_INTERVAL_MS", "100");
  cfg.feed_batch_size = get_size("FEED_BATCH_SIZE", "100");
  cfg.topic_event_inbox_capacity = get_size("TOPIC_EVENT_INBOX_CAPACITY", "1");
  cfg.topic_registration_inbox_capacity = get_size("TOPIC_REGISTRATION_INBOX_CAPACITY", "1");
  cfg.registration_timeout_ms = get_size("REGISTRATION_TIMEOUT_MS", "2000");
  cfg.topic_idle_timeout_seconds = get_size("TOPIC_IDLE_TIMEOUT_SECONDS", "300");
  cfg.sse_keepalive_seconds = get_size("SSE_KEEPALIVE_SECONDS", "5");
  cfg.fanout_threads = get_size("FANOUT_THREADS", "2");
  cfg.session_cookie_name = get_env("SESSION_COOKIE_NAME", "session");
  return cfg;
}

}  // namespace chatlive
