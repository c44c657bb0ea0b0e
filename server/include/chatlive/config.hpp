/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_stream_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace chatlive {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::size_t feed_poll_interval_ms;
  std::size_t feed_batch_size;
  std::size_t topic_event_inbox_capacity;
  std::size_t topic_registration_inbox_capacity;
  std::size_t registration_timeout_ms;
  std::size_t topic_idle_timeout_seconds;
  std::size_t sse_keepalive_seconds;
  std::size_t fanout_threads;
  std::string session_cookie_name;
};

AppConfig LoadConfigFromEnv();

}  // namespace chatlive
