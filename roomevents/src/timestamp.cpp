/*
 * 설명: 밀리초 타임스탬프 변환과 범위 검사를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/timestamp_test.cpp
 */
#include "roomevents/timestamp.hpp"

#include <algorithm>

namespace roomevents {
namespace {
std::uint64_t MaxClockMillis() {
  auto max_millis = std::chrono::duration_cast<std::chrono::milliseconds>(Timestamp::duration::max()).count();
  return static_cast<std::uint64_t>(max_millis);
}
}  // namespace

std::uint64_t ToWireTimestamp(Timestamp instant) {
  auto since_epoch = instant.time_since_epoch();
  if (since_epoch < Timestamp::duration::zero()) {
    throw TimestampOverflow("instant precedes the Unix epoch");
  }
  auto millis = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
  if (millis > kMaxWireTimestamp) {
    throw TimestampOverflow("milliseconds since epoch exceed " + std::to_string(kMaxWireTimestamp));
  }
  return millis;
}

Timestamp FromWireTimestamp(std::uint64_t millis) {
  std::chrono::milliseconds elapsed(static_cast<std::chrono::milliseconds::rep>(millis));
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(elapsed));
}

bool IsRepresentableTimestamp(std::uint64_t millis) {
  return millis <= std::min(kMaxWireTimestamp, MaxClockMillis());
}

}  // namespace roomevents
