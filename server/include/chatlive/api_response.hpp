/*
 * 설명: REST 응답 엔벨로프와 Server-Sent Events 프레임 생성을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatlive {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// 여러 줄 데이터는 줄마다 "data:" 필드로 나눈다. 프레임은 빈 줄로 끝난다.
std::string ToSseFrame(std::string_view event, std::string_view data);
std::string ToSseComment(std::string_view text);

}  // namespace chatlive
