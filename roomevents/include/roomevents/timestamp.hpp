/*
 * 설명: origin_server_ts 필드의 밀리초 정수 <-> 시각 변환을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/timestamp_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace roomevents {

using Timestamp = std::chrono::system_clock::time_point;

// JSON 안전 정수 상한 (2^53 - 1).
constexpr std::uint64_t kMaxWireTimestamp = 9007199254740991ULL;

class TimestampOverflow : public std::range_error {
 public:
  explicit TimestampOverflow(const std::string& message) : std::range_error(message) {}
};

// 에포크 이전이거나 상한을 넘으면 TimestampOverflow.
std::uint64_t ToWireTimestamp(Timestamp instant);

// 검증하지 않는다. 호출 전에 IsRepresentableTimestamp로 확인해야 한다.
Timestamp FromWireTimestamp(std::uint64_t millis);

bool IsRepresentableTimestamp(std::uint64_t millis);

}  // namespace roomevents
