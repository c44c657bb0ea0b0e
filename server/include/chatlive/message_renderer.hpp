/*
 * 설명: 변경 이벤트를 구독자별 HTML 조각으로 렌더링한다. 구독자마다 달라지는 부분은 작성자 여부뿐이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_renderer_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "chatlive/change_event.hpp"
#include "chatlive/delivery_channel.hpp"
#include "chatlive/message_store.hpp"
#include "chatlive/uuid.hpp"

namespace chatlive {

// 생성 시각은 메시지 id(UUID v7 등)에서 얻는다. 시각이 없는 id는 error_code "no_timestamp"로 실패한다.
std::optional<RenderedEvent> RenderMessageEvent(const ChatMessage& message, ChangeKind kind, const Uuid& viewer,
                                                const TopicKey& topic, std::chrono::system_clock::time_point now,
                                                std::string& error_code, std::string& error_message);

// 모든 구독자에게 동일하게 전달되는 삭제 지시
RenderedEvent RenderDeleteEvent(const Uuid& message_id);

std::string EscapeHtml(std::string_view text);
std::string ToRfc3339(std::chrono::system_clock::time_point tp);
std::string ToRelativeLabel(std::chrono::system_clock::time_point then, std::chrono::system_clock::time_point now);

}  // namespace chatlive
