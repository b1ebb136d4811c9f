/*
 * 설명: 표준 입력의 줄 단위 상태 이벤트를 묶음 디코딩하고 정규 형태로 출력한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/tool_app_test.cpp
 */
#include "roomevents/tool_app.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "roomevents/batch_decoder.hpp"

namespace roomevents {

ToolApp::ToolApp(ToolConfig config) : config_(std::move(config)) {}

int ToolApp::Run(std::istream& in, std::ostream& out, std::ostream& log) {
  auto observability = std::make_shared<Observability>(log, ParseLogLevel(config_.log_level));
  BatchDecoder decoder(ToDecodeOptions(config_), observability);

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }

  auto outcomes = decoder.DecodeAll(lines, config_.workers);
  auto encoded = decoder.EncodeAll(outcomes);
  bool all_ok = true;
  for (const auto& output : encoded) {
    if (output) {
      out << *output << "\n";
    } else {
      all_ok = false;
    }
  }

  auto snapshot = observability->Snapshot();
  LogContext summary;
  summary.trace_id = observability->NextTraceId();
  summary.name = "state_event.batch_done";
  summary.message = std::to_string(snapshot.decode_total) + " decoded, " + std::to_string(snapshot.decode_errors) +
                    " decode errors, " + std::to_string(snapshot.encode_errors) + " encode errors";
  observability->Log(summary);
  return all_ok ? 0 : 1;
}

}  // namespace roomevents
