/*
 * 설명: asio 스레드 풀로 입력 묶음을 병렬 디코딩하고 실패를 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/batch_decoder_test.cpp
 */
#include "roomevents/batch_decoder.hpp"

#include <algorithm>
#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace roomevents {
namespace {
long ElapsedMs(std::chrono::steady_clock::time_point start) {
  auto elapsed = std::chrono::steady_clock::now() - start;
  return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}
}  // namespace

BatchDecoder::BatchDecoder(DecodeOptions options, std::shared_ptr<Observability> observability)
    : options_(options), observability_(std::move(observability)) {}

DecodeOutcome BatchDecoder::DecodeOne(const std::string& input, std::size_t index) const {
  const auto start = std::chrono::steady_clock::now();
  observability_->IncrementDecode();
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.index = index;

  DecodeOutcome outcome;
  try {
    outcome.event = ParseStateEvent<AnyStateEventContent>(input, options_);
    ctx.level = LogLevel::kDebug;
    ctx.name = "state_event.decoded";
    ctx.event_type = outcome.event->content.EventType();
  } catch (const DecodeError& ex) {
    observability_->IncrementDecodeError();
    ctx.level = LogLevel::kError;
    ctx.name = "state_event.decode_failed";
    ctx.field = ex.field;
    ctx.message = ex.what();
    if (!ex.event_type.empty()) {
      ctx.event_type = ex.event_type;
    }
    outcome.error = ex;
  }
  ctx.latency_ms = ElapsedMs(start);
  observability_->Log(ctx);
  return outcome;
}

std::vector<DecodeOutcome> BatchDecoder::DecodeAll(const std::vector<std::string>& inputs,
                                                   unsigned int workers) const {
  std::vector<DecodeOutcome> outcomes(inputs.size());
  // 입력마다 결과 칸이 따로 있으므로 잠금 없이 쓴다.
  boost::asio::thread_pool pool(std::max(1u, workers));
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    boost::asio::post(pool, [this, &inputs, &outcomes, i]() { outcomes[i] = DecodeOne(inputs[i], i); });
  }
  pool.join();
  return outcomes;
}

std::vector<std::optional<std::string>> BatchDecoder::EncodeAll(const std::vector<DecodeOutcome>& outcomes) const {
  std::vector<std::optional<std::string>> encoded;
  encoded.reserve(outcomes.size());
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    if (!outcomes[i].ok()) {
      encoded.emplace_back(std::nullopt);
      continue;
    }
    observability_->IncrementEncode();
    try {
      encoded.emplace_back(SerializeStateEvent(*outcomes[i].event));
    } catch (const EncodeError& ex) {
      observability_->IncrementEncodeError();
      LogContext ctx;
      ctx.level = LogLevel::kError;
      ctx.trace_id = observability_->NextTraceId();
      ctx.name = "state_event.encode_failed";
      ctx.index = i;
      ctx.field = ex.field;
      ctx.message = ex.what();
      observability_->Log(ctx);
      encoded.emplace_back(std::nullopt);
    }
  }
  return encoded;
}

}  // namespace roomevents
