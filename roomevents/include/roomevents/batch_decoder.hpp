/*
 * 설명: 독립적인 상태 이벤트 입력 묶음을 워커 풀에서 디코딩/재인코딩한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/batch_decoder_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "roomevents/any_state_event_content.hpp"
#include "roomevents/observability.hpp"
#include "roomevents/state_event.hpp"

namespace roomevents {

using AnyStateEvent = StateEvent<AnyStateEventContent>;

struct DecodeOutcome {
  std::optional<AnyStateEvent> event;
  std::optional<DecodeError> error;

  bool ok() const { return event.has_value(); }
};

class BatchDecoder {
 public:
  BatchDecoder(DecodeOptions options, std::shared_ptr<Observability> observability);

  // 결과는 입력 순서를 유지한다. 항목별 실패는 error에 담기고 로그로 남는다.
  std::vector<DecodeOutcome> DecodeAll(const std::vector<std::string>& inputs, unsigned int workers) const;

  // 실패했거나 인코딩할 수 없는 항목은 std::nullopt.
  std::vector<std::optional<std::string>> EncodeAll(const std::vector<DecodeOutcome>& outcomes) const;

 private:
  DecodeOutcome DecodeOne(const std::string& input, std::size_t index) const;

  DecodeOptions options_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace roomevents
