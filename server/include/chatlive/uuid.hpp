/*
 * 설명: 메시지/채널/사용자 식별자로 쓰이는 UUID 값 타입과 파싱, 타임스탬프 추출을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/uuid_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chatlive {

class Uuid {
 public:
  // 하이픈이 포함된 정규 텍스트 표기 길이 (8-4-4-4-12)
  static constexpr std::size_t kTextLength = 36;

  Uuid() = default;
  explicit Uuid(const std::array<std::uint8_t, 16>& bytes) : bytes_(bytes) {}

  static std::optional<Uuid> Parse(std::string_view text);
  // 현재 시각 기반 v7 식별자. 난수는 OpenSSL RAND_bytes를 사용한다.
  static Uuid GenerateV7();

  std::string ToString() const;
  int Version() const { return bytes_[6] >> 4; }
  bool IsNil() const;

  // v1/v6/v7만 시각을 담고 있다. 그 외 버전은 nullopt.
  std::optional<std::chrono::system_clock::time_point> Timestamp() const;

  const std::array<std::uint8_t, 16>& Bytes() const { return bytes_; }

  bool operator==(const Uuid& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Uuid& other) const { return bytes_ != other.bytes_; }
  bool operator<(const Uuid& other) const { return bytes_ < other.bytes_; }

 private:
  std::array<std::uint8_t, 16> bytes_{};
};

struct UuidHash {
  std::size_t operator()(const Uuid& id) const noexcept;
};

}  // namespace chatlive
