/*
 * 설명: 상태 이벤트 디코딩/인코딩 실패를 표현하는 예외 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/state_event_decode_test.cpp, roomevents/tests/unit/state_event_encode_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace roomevents {

enum class DecodeErrorKind {
  kMissingField,
  kDuplicateField,
  kInvalidField,
  kUnknownField,
  kUnknownEventType,
  kContent,
  kTimestampOverflow,
  kNotAnObject,
  kSyntax,
};

enum class EncodeErrorKind {
  kTimestampOverflow,
};

const char* ToString(DecodeErrorKind kind);
const char* ToString(EncodeErrorKind kind);

// 디코딩은 전부 성공하거나 이 예외 하나로 실패한다.
class DecodeError : public std::runtime_error {
 public:
  DecodeError(DecodeErrorKind kind, std::string field, const std::string& detail, std::string event_type = {});

  static DecodeError MissingField(const std::string& field);
  static DecodeError DuplicateField(const std::string& field);
  static DecodeError InvalidField(const std::string& field, const std::string& detail);

  DecodeErrorKind kind;
  std::string field;
  std::string event_type;
};

class EncodeError : public std::runtime_error {
 public:
  EncodeError(EncodeErrorKind kind, std::string field, const std::string& detail)
      : std::runtime_error(detail), kind(kind), field(std::move(field)) {}
  EncodeErrorKind kind;
  std::string field;
};

// 콘텐츠 스키마 해석기가 판별자나 페이로드를 거부할 때 던진다.
class ContentError : public std::runtime_error {
 public:
  ContentError(std::string event_type, const std::string& message, bool unknown_type = false)
      : std::runtime_error(message), event_type(std::move(event_type)), unknown_type(unknown_type) {}
  std::string event_type;
  bool unknown_type;
};

}  // namespace roomevents
