/*
 * 설명: 세션 토큰 해시와 user_sessions 조회로 시청자를 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/001_live_updates.sql
 * 테스트: server/tests/unit/session_token_test.cpp, server/tests/e2e/live_stream_test.cpp
 */
#include "chatlive/auth.hpp"

#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

#include "chatlive/message_store.hpp"

namespace chatlive {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string Trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}
}  // namespace

std::string HashSessionToken(const std::string& token) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), token.data(), token.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("세션 토큰 해시 계산 실패");
  }
  return BytesToHex(digest, digest_len);
}

std::string ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

std::string FindCookie(const std::string& cookie_header, const std::string& name) {
  std::size_t pos = 0;
  while (pos < cookie_header.size()) {
    auto semi = cookie_header.find(';', pos);
    std::string pair = cookie_header.substr(pos, semi == std::string::npos ? std::string::npos : semi - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && Trim(pair.substr(0, eq)) == name) {
      return Trim(pair.substr(eq + 1));
    }
    if (semi == std::string::npos) {
      break;
    }
    pos = semi + 1;
  }
  return "";
}

SessionAuthenticator::SessionAuthenticator(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::optional<AuthViewer> SessionAuthenticator::ValidateToken(const std::string& token) {
  if (token.empty()) {
    return std::nullopt;
  }
  const auto token_hash = HashSessionToken(token);
  std::optional<AuthViewer> viewer;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT u.id, u.name, s.expires_at FROM user_sessions AS s "
        << "JOIN chat_users AS u ON u.id = s.user_id WHERE s.token_hash = '"
        << db_client_->Escape(conn, token_hash) << "' AND s.expires_at > UTC_TIMESTAMP(6) LIMIT 1;";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "세션 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "세션 조회 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0] && row[1] && row[2]) {
      auto user_id = Uuid::Parse(row[0]);
      auto expires_at = ParseDbTimestamp(row[2]);
      if (user_id && expires_at) {
        viewer = AuthViewer{*user_id, row[1], *expires_at};
      }
    }
    mysql_free_result(res);
  });
  return viewer;
}

}  // namespace chatlive
