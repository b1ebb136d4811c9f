/*
 * 설명: 등록된 상태 콘텐츠 스키마를 판별자로 고르는 태그 유니온을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/room_content_test.cpp, roomevents/tests/unit/state_event_decode_test.cpp
 */
#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "roomevents/room_content.hpp"

namespace roomevents {

class AnyStateEventContent {
 public:
  using Variant = std::variant<AliasesEventContent, AvatarEventContent>;

  AnyStateEventContent(AliasesEventContent content) : value_(std::move(content)) {}
  AnyStateEventContent(AvatarEventContent content) : value_(std::move(content)) {}

  std::string EventType() const;
  // 등록되지 않은 판별자는 ContentError(unknown_type = true).
  static AnyStateEventContent FromParts(const std::string& event_type, const nlohmann::json& raw);
  nlohmann::ordered_json ToJson() const;

  static std::vector<std::string> KnownEventTypes();
  static bool IsKnownEventType(const std::string& event_type);

  const Variant& value() const { return value_; }

  template <typename T>
  const T* get_if() const {
    return std::get_if<T>(&value_);
  }

  bool operator==(const AnyStateEventContent& other) const { return value_ == other.value_; }
  bool operator!=(const AnyStateEventContent& other) const { return !(*this == other); }

 private:
  Variant value_;
};

}  // namespace roomevents
