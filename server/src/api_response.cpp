/*
 * 설명: JSON 응답 엔벨로프와 SSE 프레임을 생성하고 직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "chatlive/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace chatlive {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

std::string ToSseFrame(std::string_view event, std::string_view data) {
  std::string frame;
  frame.reserve(event.size() + data.size() + 32);
  frame.append("event: ").append(event).append("\n");
  // "\r\n", "\r", "\n" 모두 줄 끝으로 본다.
  std::size_t pos = 0;
  while (true) {
    auto brk = data.find_first_of("\r\n", pos);
    frame.append("data: ").append(data.substr(pos, brk == std::string_view::npos ? std::string_view::npos : brk - pos));
    frame.append("\n");
    if (brk == std::string_view::npos) {
      break;
    }
    pos = brk + 1;
    if (data[brk] == '\r' && pos < data.size() && data[pos] == '\n') {
      ++pos;
    }
  }
  frame.append("\n");
  return frame;
}

std::string ToSseComment(std::string_view text) {
  std::string frame(":");
  frame.append(text).append("\n\n");
  return frame;
}

}  // namespace chatlive
