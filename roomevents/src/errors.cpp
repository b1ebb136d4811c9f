/*
 * 설명: 디코딩/인코딩 예외의 메시지 구성을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/state_event_decode_test.cpp
 */
#include "roomevents/errors.hpp"

namespace roomevents {
namespace {
std::string BuildMessage(DecodeErrorKind kind, const std::string& field, const std::string& detail) {
  std::string message = ToString(kind);
  if (!field.empty()) {
    message += " `" + field + "`";
  }
  if (!detail.empty()) {
    message += ": " + detail;
  }
  return message;
}
}  // namespace

const char* ToString(DecodeErrorKind kind) {
  switch (kind) {
    case DecodeErrorKind::kMissingField:
      return "missing field";
    case DecodeErrorKind::kDuplicateField:
      return "duplicate field";
    case DecodeErrorKind::kInvalidField:
      return "invalid field";
    case DecodeErrorKind::kUnknownField:
      return "unknown field";
    case DecodeErrorKind::kUnknownEventType:
      return "unknown event type";
    case DecodeErrorKind::kContent:
      return "invalid content";
    case DecodeErrorKind::kTimestampOverflow:
      return "timestamp overflow";
    case DecodeErrorKind::kNotAnObject:
      return "not an object";
    case DecodeErrorKind::kSyntax:
      return "syntax error";
  }
  return "decode error";
}

const char* ToString(EncodeErrorKind kind) {
  switch (kind) {
    case EncodeErrorKind::kTimestampOverflow:
      return "timestamp overflow";
  }
  return "encode error";
}

DecodeError::DecodeError(DecodeErrorKind kind, std::string field, const std::string& detail, std::string event_type)
    : std::runtime_error(BuildMessage(kind, field, detail)),
      kind(kind),
      field(std::move(field)),
      event_type(std::move(event_type)) {}

DecodeError DecodeError::MissingField(const std::string& field) {
  return DecodeError(DecodeErrorKind::kMissingField, field, "");
}

DecodeError DecodeError::DuplicateField(const std::string& field) {
  return DecodeError(DecodeErrorKind::kDuplicateField, field, "");
}

DecodeError DecodeError::InvalidField(const std::string& field, const std::string& detail) {
  return DecodeError(DecodeErrorKind::kInvalidField, field, detail);
}

}  // namespace roomevents
