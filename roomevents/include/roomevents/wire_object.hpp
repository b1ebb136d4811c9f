/*
 * 설명: JSON 최상위 객체를 입력 순서와 중복 키를 유지한 엔트리 목록으로 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/wire_object_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace roomevents {

struct WireEntry {
  std::string key;
  nlohmann::json value;
};

// nlohmann::json 객체는 중복 키를 표현하지 못하므로 디코더 입력은 이 목록을 쓴다.
using WireObject = std::vector<WireEntry>;

// 문법 오류는 DecodeError(kSyntax), 최상위가 객체가 아니면 DecodeError(kNotAnObject).
WireObject ReadWireObject(std::string_view text);

// 이미 파싱된 객체를 변환한다. 객체가 아니면 DecodeError(kNotAnObject).
WireObject ToWireObject(const nlohmann::json& object);

}  // namespace roomevents
