/*
 * 설명: 세션 토큰으로 스트림을 여는 시청자를 식별한다. 토큰 원문은 저장하지 않고 SHA-256 해시로 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/001_live_updates.sql
 * 테스트: server/tests/unit/session_token_test.cpp, server/tests/e2e/live_stream_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "chatlive/db_client.hpp"
#include "chatlive/uuid.hpp"

namespace chatlive {

struct AuthViewer {
  Uuid user_id;
  std::string name;
  std::chrono::system_clock::time_point expires_at;
};

std::string HashSessionToken(const std::string& token);

// "Bearer <token>" 형식이 아니면 빈 문자열
std::string ParseBearer(const std::string& header_value);

// Cookie 헤더에서 name에 해당하는 값을 찾는다.
std::string FindCookie(const std::string& cookie_header, const std::string& name);

class SessionAuthenticator {
 public:
  explicit SessionAuthenticator(std::shared_ptr<MariaDbClient> db_client);

  // 만료되었거나 없는 토큰이면 nullopt. 저장소 오류는 DbException으로 던진다.
  std::optional<AuthViewer> ValidateToken(const std::string& token);

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace chatlive
