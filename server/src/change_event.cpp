/*
 * 설명: 변경 알림 디코드 규칙(채널명 집합, 72자 페이로드, 정규 UUID)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/001_live_updates.sql
 * 테스트: server/tests/unit/change_event_decode_test.cpp
 */
#include "chatlive/change_event.hpp"

namespace chatlive {

std::string_view ToString(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kInsert:
      return "insert";
    case ChangeKind::kUpdate:
      return "update";
    case ChangeKind::kDelete:
      return "delete";
  }
  return "unknown";
}

std::string_view ToString(DecodeError error) {
  switch (error) {
    case DecodeError::kNone:
      return "none";
    case DecodeError::kUnknownChannel:
      return "unknown_channel";
    case DecodeError::kMalformedPayloadLength:
      return "malformed_payload_length";
    case DecodeError::kMalformedIdentifier:
      return "malformed_identifier";
  }
  return "unknown";
}

DecodeResult DecodeNotification(std::string_view channel, std::string_view payload) {
  DecodeResult result;
  if (payload.size() != Uuid::kTextLength * 2) {
    result.error = DecodeError::kMalformedPayloadLength;
    result.reason = "페이로드가 정확히 UUID 두 개 길이가 아닙니다 (" + std::to_string(payload.size()) + "자)";
    return result;
  }

  ChangeKind kind;
  if (channel == "insert") {
    kind = ChangeKind::kInsert;
  } else if (channel == "update") {
    kind = ChangeKind::kUpdate;
  } else if (channel == "delete") {
    kind = ChangeKind::kDelete;
  } else {
    result.error = DecodeError::kUnknownChannel;
    result.reason = "알 수 없는 알림 채널: " + std::string(channel);
    return result;
  }

  auto entity_text = payload.substr(0, Uuid::kTextLength);
  auto topic_text = payload.substr(Uuid::kTextLength);
  auto entity_id = Uuid::Parse(entity_text);
  auto topic_id = Uuid::Parse(topic_text);
  if (!entity_id || !topic_id) {
    result.error = DecodeError::kMalformedIdentifier;
    result.reason = "식별자 파싱 실패: entity=" + std::string(entity_text) + " topic=" + std::string(topic_text);
    return result;
  }

  result.event = ChangeEvent{kind, *entity_id, *topic_id};
  return result;
}

}  // namespace chatlive
