/*
 * 설명: 도구 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/config_test.cpp
 */
#pragma once

#include <string>

#include "roomevents/state_event.hpp"

namespace roomevents {

struct ToolConfig {
  bool strict_fields;
  unsigned int workers;
  std::string log_level;
};

// ROOMEVENTS_STRICT_FIELDS, ROOMEVENTS_WORKERS, LOG_LEVEL. 형식이 틀리면 std::invalid_argument.
ToolConfig LoadConfigFromEnv();

DecodeOptions ToDecodeOptions(const ToolConfig& config);

}  // namespace roomevents
