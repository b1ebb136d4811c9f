/*
 * 설명: 환경변수에서 도구 설정을 읽어 기본값과 병합한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/config_test.cpp
 */
#include "roomevents/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

namespace roomevents {
namespace {
bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "1" || value == "true" || value == "yes") {
    return true;
  }
  if (value.empty() || value == "0" || value == "false" || value == "no") {
    return false;
  }
  throw std::invalid_argument(key + " must be a boolean: " + value);
}

constexpr unsigned long kMaxWorkers = 1024;

unsigned int ParseWorkers(const std::string& value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw std::invalid_argument("ROOMEVENTS_WORKERS must be a non-negative integer: " + value);
  }
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("ROOMEVENTS_WORKERS is too large: " + value);
  }
  if (parsed > kMaxWorkers) {
    throw std::invalid_argument("ROOMEVENTS_WORKERS must be at most " + std::to_string(kMaxWorkers) + ": " + value);
  }
  // 0은 하드웨어 스레드 수를 쓴다.
  if (parsed == 0) {
    return std::max(1u, std::thread::hardware_concurrency());
  }
  return static_cast<unsigned int>(parsed);
}
}  // namespace

ToolConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  ToolConfig cfg;
  cfg.strict_fields = ParseBool("ROOMEVENTS_STRICT_FIELDS", get_env("ROOMEVENTS_STRICT_FIELDS", "false"));
  cfg.workers = ParseWorkers(get_env("ROOMEVENTS_WORKERS", "1"));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  return cfg;
}

DecodeOptions ToDecodeOptions(const ToolConfig& config) {
  DecodeOptions options;
  options.reject_unknown_fields = config.strict_fields;
  return options;
}

}  // namespace roomevents
