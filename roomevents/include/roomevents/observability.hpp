/*
 * 설명: 구조화 로그와 디코딩/인코딩 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace roomevents {

enum class LogLevel { kDebug, kInfo, kError };

// 알 수 없는 값은 info로 본다.
LogLevel ParseLogLevel(const std::string& value);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string trace_id;
  std::string name;
  long latency_ms{0};
  std::optional<std::size_t> index;
  std::optional<std::string> event_type;
  std::optional<std::string> field;
  std::optional<std::string> message;
};

struct MetricsSnapshot {
  std::uint64_t decode_total{0};
  std::uint64_t decode_errors{0};
  std::uint64_t encode_total{0};
  std::uint64_t encode_errors{0};
};

class Observability {
 public:
  explicit Observability(std::ostream& out = std::cout, LogLevel min_level = LogLevel::kInfo)
      : out_(out), min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementDecode();
  void IncrementDecodeError();
  void IncrementEncode();
  void IncrementEncodeError();
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx);

 private:
  std::ostream& out_;
  LogLevel min_level_;
  std::mutex out_mutex_;
  std::atomic<std::uint64_t> decode_total_{0};
  std::atomic<std::uint64_t> decode_errors_{0};
  std::atomic<std::uint64_t> encode_total_{0};
  std::atomic<std::uint64_t> encode_errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace roomevents
