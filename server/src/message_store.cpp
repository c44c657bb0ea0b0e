/*
 * 설명: MariaDB에서 메시지와 작성자 이름을 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/001_live_updates.sql
 * 테스트: server/tests/it/message_store_it_test.cpp
 */
#include "chatlive/message_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace chatlive {

std::optional<std::chrono::system_clock::time_point> ParseDbTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  if (iss.peek() == '.') {
    iss.get();
    std::string fraction;
    char c;
    while (fraction.size() < 6 && iss.get(c) && c >= '0' && c <= '9') {
      fraction.push_back(c);
    }
    if (!fraction.empty()) {
      fraction.resize(6, '0');
      tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::microseconds(std::stol(fraction)));
    }
  }
  return tp;
}

MariaDbMessageStore::MariaDbMessageStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::optional<ChatMessage> MariaDbMessageStore::FetchMessage(const Uuid& message_id) {
  std::optional<ChatMessage> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT m.id, m.content, m.updated, m.author, u.name FROM messages AS m "
        << "JOIN chat_users AS u ON u.id = m.author WHERE m.id = '"
        << db_client_->Escape(conn, message_id.ToString()) << "' LIMIT 1;";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "메시지 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "메시지 조회 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row) {
      try {
        result = BuildMessage(row, mysql_fetch_lengths(res));
      } catch (...) {
        mysql_free_result(res);
        throw;
      }
    }
    mysql_free_result(res);
  });
  return result;
}

ChatMessage MariaDbMessageStore::BuildMessage(MYSQL_ROW row, unsigned long* lengths) const {
  auto column = [&](int index) {
    return row[index] ? std::string(row[index], lengths[index]) : std::string{};
  };
  auto id = Uuid::Parse(column(0));
  auto author = Uuid::Parse(column(3));
  auto updated = ParseDbTimestamp(column(2));
  if (!id || !author || !updated) {
    throw DbException("메시지 행 형식이 올바르지 않습니다", 0, false);
  }
  return ChatMessage{*id, column(1), *updated, *author, column(4)};
}

}  // namespace chatlive
