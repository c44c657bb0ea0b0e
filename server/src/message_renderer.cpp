/*
 * 설명: 메시지 HTML 조각과 삭제 지시, 시각 표기를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_renderer_test.cpp
 */
#include "chatlive/message_renderer.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chatlive {
namespace {
std::string Plural(long long count, const char* unit) {
  std::ostringstream oss;
  oss << count << " " << unit << "s ago";
  return oss.str();
}

std::string MessagePath(const TopicKey& topic, const Uuid& message_id) {
  return "/servers/" + topic.server_id.ToString() + "/channels/" + topic.channel_id.ToString() + "/messages/" +
         message_id.ToString();
}
}  // namespace

std::string EscapeHtml(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\r':
        out += "&#13;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::string ToRfc3339(std::chrono::system_clock::time_point tp) {
  auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  if (secs > tp) {
    secs -= std::chrono::seconds(1);
  }
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - secs).count();
  auto tt = std::chrono::system_clock::to_time_t(secs);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (nanos != 0) {
    oss << '.' << std::setfill('0');
    if (nanos % 1000000 == 0) {
      oss << std::setw(3) << nanos / 1000000;
    } else if (nanos % 1000 == 0) {
      oss << std::setw(6) << nanos / 1000;
    } else {
      oss << std::setw(9) << nanos;
    }
  }
  oss << "+00:00";
  return oss.str();
}

std::string ToRelativeLabel(std::chrono::system_clock::time_point then, std::chrono::system_clock::time_point now) {
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now - then).count();
  if (seconds < 0) {
    seconds = -seconds;
  }
  constexpr long long kMinute = 60;
  constexpr long long kHour = 60 * kMinute;
  constexpr long long kDay = 24 * kHour;
  constexpr long long kMonth = 30 * kDay;
  constexpr long long kYear = 365 * kDay;
  if (seconds < 45) {
    return "just now";
  }
  if (seconds < 90) {
    return "a minute ago";
  }
  if (seconds < kHour) {
    return Plural(std::min<long long>(59, (seconds + kMinute / 2) / kMinute), "minute");
  }
  if (seconds < 2 * kHour) {
    return "an hour ago";
  }
  if (seconds < kDay) {
    return Plural(seconds / kHour, "hour");
  }
  if (seconds < 2 * kDay) {
    return "a day ago";
  }
  if (seconds < kMonth) {
    return Plural(seconds / kDay, "day");
  }
  if (seconds < 2 * kMonth) {
    return "a month ago";
  }
  if (seconds < kYear) {
    return Plural(seconds / kMonth, "month");
  }
  if (seconds < 2 * kYear) {
    return "a year ago";
  }
  return Plural(seconds / kYear, "year");
}

std::optional<RenderedEvent> RenderMessageEvent(const ChatMessage& message, ChangeKind kind, const Uuid& viewer,
                                                const TopicKey& topic, std::chrono::system_clock::time_point now,
                                                std::string& error_code, std::string& error_message) {
  auto created_at = message.id.Timestamp();
  if (!created_at) {
    error_code = "no_timestamp";
    error_message = "메시지 id에서 생성 시각을 얻을 수 없습니다: " + message.id.ToString();
    return std::nullopt;
  }
  const bool is_author = message.author == viewer;
  const std::string path = MessagePath(topic, message.id);

  std::ostringstream html;
  html << "<li class=\"group chat " << (is_author ? "chat-end" : "chat-start") << "\" id=\"msg-"
       << message.id.ToString() << "\"";
  if (kind == ChangeKind::kUpdate) {
    html << " hx-swap-oob=\"true\"";
  }
  html << ">";

  html << "<div class=\"chat-header\">";
  if (message.updated > *created_at) {
    html << "<span class=\"italic text-xs opacity-50\">Edited </span>";
  }
  html << EscapeHtml(message.author_name) << " "
       << "<time class=\"text-xs opacity-50\" datetime=\"" << ToRfc3339(*created_at) << "\">"
       << ToRelativeLabel(*created_at, now) << "</time></div>";

  html << "<div class=\"chat-bubble" << (is_author ? " chat-bubble-primary" : "") << "\">"
       << EscapeHtml(message.content) << "</div>";

  html << "<div class=\"chat-footer transition-opacity\" hx-target=\"closest li\" hx-swap=\"outerHTML\">";
  if (is_author) {
    html << "<button class=\"link mr-2 opacity-0 group-hover:opacity-100\" hx-get=\"" << path
         << "/editable\">Edit</button>";
  }
  html << "<button class=\"link link-error opacity-0 group-hover:opacity-100\" hx-delete=\"" << path
       << "\" hx-confirm=\"Are you sure?\">Delete</button>";
  html << "</div></li>";

  return RenderedEvent{kind, message.id, html.str()};
}

RenderedEvent RenderDeleteEvent(const Uuid& message_id) {
  RenderedEvent event{ChangeKind::kDelete, message_id, {}};
  event.html = "<div id=\"" + event.ElementId() + "\" hx-swap-oob=\"delete\"></div>";
  return event;
}

}  // namespace chatlive
