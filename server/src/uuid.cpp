/*
 * 설명: UUID 정규 표기 파싱/직렬화와 버전별 타임스탬프 해석을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/uuid_test.cpp
 */
#include "chatlive/uuid.hpp"

#include <ratio>
#include <stdexcept>

#include <openssl/rand.h>

namespace chatlive {
namespace {
constexpr char kHexDigits[] = "0123456789abcdef";
// 1582-10-15 부터 1970-01-01 까지의 100ns 구간 수
constexpr std::uint64_t kGregorianOffset = 0x01B21DD213814000ULL;

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool IsHyphenPosition(std::size_t pos) { return pos == 8 || pos == 13 || pos == 18 || pos == 23; }

// system_clock::duration으로 표현할 수 없는 시각이면 nullopt
template <typename Duration>
std::optional<std::chrono::system_clock::time_point> ToSystemTime(Duration since_epoch) {
  constexpr auto kMax = std::chrono::duration_cast<Duration>(std::chrono::system_clock::duration::max());
  constexpr auto kMin = std::chrono::duration_cast<Duration>(std::chrono::system_clock::duration::min());
  if (since_epoch > kMax || since_epoch < kMin) {
    return std::nullopt;
  }
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

using GregorianTicks = std::chrono::duration<std::int64_t, std::ratio<1, 10000000>>;

std::optional<std::chrono::system_clock::time_point> FromGregorianTicks(std::uint64_t ticks) {
  auto since_epoch = static_cast<std::int64_t>(ticks) - static_cast<std::int64_t>(kGregorianOffset);
  return ToSystemTime(GregorianTicks(since_epoch));
}
}  // namespace

std::optional<Uuid> Uuid::Parse(std::string_view text) {
  if (text.size() != kTextLength) {
    return std::nullopt;
  }
  std::array<std::uint8_t, 16> bytes{};
  std::size_t out = 0;
  for (std::size_t i = 0; i < text.size();) {
    if (IsHyphenPosition(i)) {
      if (text[i] != '-') {
        return std::nullopt;
      }
      ++i;
      continue;
    }
    int high = HexValue(text[i]);
    int low = HexValue(text[i + 1]);
    if (high < 0 || low < 0 || IsHyphenPosition(i + 1)) {
      return std::nullopt;
    }
    bytes[out++] = static_cast<std::uint8_t>((high << 4) | low);
    i += 2;
  }
  return Uuid(bytes);
}

Uuid Uuid::GenerateV7() {
  std::array<std::uint8_t, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("UUID 난수 생성 실패");
  }
  auto ms = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                           std::chrono::system_clock::now().time_since_epoch())
                                           .count());
  for (int i = 0; i < 6; ++i) {
    bytes[i] = static_cast<std::uint8_t>(ms >> (8 * (5 - i)));
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x70);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
  return Uuid(bytes);
}

std::string Uuid::ToString() const {
  std::string text;
  text.reserve(kTextLength);
  for (std::size_t i = 0; i < bytes_.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      text.push_back('-');
    }
    text.push_back(kHexDigits[bytes_[i] >> 4]);
    text.push_back(kHexDigits[bytes_[i] & 0x0F]);
  }
  return text;
}

bool Uuid::IsNil() const {
  for (auto b : bytes_) {
    if (b != 0) {
      return false;
    }
  }
  return true;
}

std::optional<std::chrono::system_clock::time_point> Uuid::Timestamp() const {
  auto be = [this](std::size_t from, std::size_t count) {
    std::uint64_t value = 0;
    for (std::size_t i = from; i < from + count; ++i) {
      value = (value << 8) | bytes_[i];
    }
    return value;
  };

  switch (Version()) {
    case 7:
      return ToSystemTime(std::chrono::milliseconds(static_cast<std::int64_t>(be(0, 6))));
    case 1: {
      std::uint64_t time_low = be(0, 4);
      std::uint64_t time_mid = be(4, 2);
      std::uint64_t time_high = be(6, 2) & 0x0FFF;
      return FromGregorianTicks((time_high << 48) | (time_mid << 32) | time_low);
    }
    case 6: {
      std::uint64_t time_high = be(0, 4);
      std::uint64_t time_mid = be(4, 2);
      std::uint64_t time_low = be(6, 2) & 0x0FFF;
      return FromGregorianTicks((time_high << 28) | (time_mid << 12) | time_low);
    }
    default:
      return std::nullopt;
  }
}

std::size_t UuidHash::operator()(const Uuid& id) const noexcept {
  std::size_t hash = 1469598103934665603ULL;
  for (auto b : id.Bytes()) {
    hash ^= b;
    hash *= 1099511628211ULL;
  }
  return hash;
}

}  // namespace chatlive
