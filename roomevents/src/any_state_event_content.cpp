/*
 * 설명: 판별자 -> 스키마 해석기 등록 테이블과 태그 유니온 위임을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/room_content_test.cpp
 */
#include "roomevents/any_state_event_content.hpp"

#include <map>

#include "roomevents/errors.hpp"

namespace roomevents {
namespace {
using ContentParser = AnyStateEventContent (*)(const std::string&, const nlohmann::json&);

template <typename Content>
AnyStateEventContent ParseAs(const std::string& event_type, const nlohmann::json& raw) {
  return AnyStateEventContent(Content::FromParts(event_type, raw));
}

// 최초 사용 시 한 번 만들고 이후 읽기만 하므로 동시 조회에 잠금이 필요 없다.
const std::map<std::string, ContentParser>& Registry() {
  static const std::map<std::string, ContentParser> kRegistry{
      {AliasesEventContent::kEventType, &ParseAs<AliasesEventContent>},
      {AvatarEventContent::kEventType, &ParseAs<AvatarEventContent>},
  };
  return kRegistry;
}
}  // namespace

std::string AnyStateEventContent::EventType() const {
  return std::visit([](const auto& content) { return content.EventType(); }, value_);
}

AnyStateEventContent AnyStateEventContent::FromParts(const std::string& event_type, const nlohmann::json& raw) {
  const auto& registry = Registry();
  auto it = registry.find(event_type);
  if (it == registry.end()) {
    throw ContentError(event_type, "no state event content registered for `" + event_type + "`", true);
  }
  return it->second(event_type, raw);
}

nlohmann::ordered_json AnyStateEventContent::ToJson() const {
  return std::visit([](const auto& content) { return content.ToJson(); }, value_);
}

std::vector<std::string> AnyStateEventContent::KnownEventTypes() {
  std::vector<std::string> types;
  for (const auto& entry : Registry()) {
    types.push_back(entry.first);
  }
  return types;
}

bool AnyStateEventContent::IsKnownEventType(const std::string& event_type) {
  return Registry().count(event_type) != 0;
}

}  // namespace roomevents
