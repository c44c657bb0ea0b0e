/*
 * 설명: 변경 이벤트 렌더링에 필요한 메시지 엔티티를 저장소에서 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/001_live_updates.sql
 * 테스트: server/tests/it/message_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "chatlive/db_client.hpp"
#include "chatlive/uuid.hpp"

namespace chatlive {

struct ChatMessage {
  Uuid id;
  std::string content;
  std::chrono::system_clock::time_point updated;
  Uuid author;
  std::string author_name;
};

// 저장소 오류는 DbException으로 던지고, 행이 없으면 nullopt를 돌려준다.
class MessageStore {
 public:
  virtual ~MessageStore() = default;
  virtual std::optional<ChatMessage> FetchMessage(const Uuid& message_id) = 0;
};

class MariaDbMessageStore : public MessageStore {
 public:
  explicit MariaDbMessageStore(std::shared_ptr<MariaDbClient> db_client);

  std::optional<ChatMessage> FetchMessage(const Uuid& message_id) override;

 private:
  ChatMessage BuildMessage(MYSQL_ROW row, unsigned long* lengths) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

// MariaDB DATETIME(6) 텍스트를 UTC 시각으로 해석한다.
std::optional<std::chrono::system_clock::time_point> ParseDbTimestamp(const std::string& text);

}  // namespace chatlive
