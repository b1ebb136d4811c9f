/*
 * 설명: 구조화 로그 출력과 디코딩/인코딩 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/observability_test.cpp
 */
#include "roomevents/observability.hpp"

#include <chrono>
#include <sstream>

namespace roomevents {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementDecode() { decode_total_.fetch_add(1); }

void Observability::IncrementDecodeError() { decode_errors_.fetch_add(1); }

void Observability::IncrementEncode() { encode_total_.fetch_add(1); }

void Observability::IncrementEncodeError() { encode_errors_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.decode_total = decode_total_.load();
  snapshot.decode_errors = decode_errors_.load();
  snapshot.encode_total = encode_total_.load();
  snapshot.encode_errors = encode_errors_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.index) {
    log_json["index"] = *ctx.index;
  }
  if (ctx.event_type) {
    log_json["eventType"] = *ctx.event_type;
  }
  if (ctx.field) {
    log_json["field"] = *ctx.field;
  }
  if (ctx.message) {
    log_json["message"] = *ctx.message;
  }
  // 파서 오류 메시지에는 입력의 원시 바이트가 섞일 수 있으므로 잘못된 UTF-8은 치환한다.
  const auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << line << std::endl;
}

}  // namespace roomevents
