/*
 * 설명: 변경 알림(채널명 + 페이로드)을 타입이 있는 변경 이벤트로 디코드한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/001_live_updates.sql
 * 테스트: server/tests/unit/change_event_decode_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "chatlive/uuid.hpp"

namespace chatlive {

enum class ChangeKind { kInsert, kUpdate, kDelete };

std::string_view ToString(ChangeKind kind);

struct ChangeEvent {
  ChangeKind kind;
  Uuid entity_id;
  Uuid topic_id;
};

// 채널 식별자와 링크 렌더링에 필요한 소속 서버 식별자
struct TopicKey {
  Uuid channel_id;
  Uuid server_id;
};

enum class DecodeError { kNone, kUnknownChannel, kMalformedPayloadLength, kMalformedIdentifier };

std::string_view ToString(DecodeError error);

struct DecodeResult {
  std::optional<ChangeEvent> event;
  DecodeError error{DecodeError::kNone};
  std::string reason;
};

// 페이로드는 엔티티 id(36자) 바로 뒤에 토픽 id(36자)가 붙은 72자 문자열이어야 한다.
DecodeResult DecodeNotification(std::string_view channel, std::string_view payload);

}  // namespace chatlive
