/*
 * 설명: 서명 범위 밖의 unsigned 부가 데이터를 표현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/unsigned_data_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace roomevents {

struct UnsignedData {
  // 이벤트 전송 후 경과 시간(ms). 서버 시계 차이로 음수일 수 있다.
  std::optional<std::int64_t> age;
  std::optional<std::string> transaction_id;
  // 그 외 키는 해석하지 않고 보존한다 (redacted_because 등).
  nlohmann::json extra = nlohmann::json::object();

  bool IsEmpty() const;

  // 객체가 아니거나 알려진 키의 타입이 틀리면 std::invalid_argument.
  static UnsignedData FromJson(const nlohmann::json& value);
  nlohmann::ordered_json ToJson() const;

  bool operator==(const UnsignedData& other) const;
  bool operator!=(const UnsignedData& other) const { return !(*this == other); }
};

}  // namespace roomevents
