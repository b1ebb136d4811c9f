/*
 * 설명: 엔벨로프의 비제네릭 필드 분류/해석과 타임스탬프 경계 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/state_event_decode_test.cpp, roomevents/tests/unit/state_event_encode_test.cpp
 */
#include "roomevents/state_event.hpp"

#include <stdexcept>
#include <unordered_map>

namespace roomevents {
namespace detail {
namespace {
const std::string& RequireString(const nlohmann::json& value, const char* field) {
  if (!value.is_string()) {
    throw DecodeError::InvalidField(field, std::string("expected string, got ") + value.type_name());
  }
  return value.get_ref<const std::string&>();
}

template <typename Id>
Id ParseIdentifier(const nlohmann::json& value, const char* field) {
  const auto& raw = RequireString(value, field);
  try {
    return Id::Parse(raw);
  } catch (const IdentifierError& ex) {
    throw DecodeError::InvalidField(field, ex.what());
  }
}
}  // namespace

Field ClassifyField(const std::string& key) {
  static const std::unordered_map<std::string, Field> kFields{
      {"type", Field::kType},
      {"content", Field::kContent},
      {"event_id", Field::kEventId},
      {"sender", Field::kSender},
      {"origin_server_ts", Field::kOriginServerTs},
      {"room_id", Field::kRoomId},
      {"state_key", Field::kStateKey},
      {"prev_content", Field::kPrevContent},
      {"unsigned", Field::kUnsigned},
  };
  auto it = kFields.find(key);
  return it == kFields.end() ? Field::kUnknown : it->second;
}

std::string ParseEventType(const nlohmann::json& value) { return RequireString(value, "type"); }

EventId ParseEventId(const nlohmann::json& value) { return ParseIdentifier<EventId>(value, "event_id"); }

UserId ParseSender(const nlohmann::json& value) { return ParseIdentifier<UserId>(value, "sender"); }

RoomId ParseRoomId(const nlohmann::json& value) { return ParseIdentifier<RoomId>(value, "room_id"); }

std::string ParseStateKey(const nlohmann::json& value) { return RequireString(value, "state_key"); }

nlohmann::json ParseOriginServerTs(const nlohmann::json& value) {
  if (!value.is_number_integer()) {
    throw DecodeError::InvalidField("origin_server_ts", std::string("expected integer, got ") + value.type_name());
  }
  return value;
}

UnsignedData ParseUnsigned(const nlohmann::json& value) {
  try {
    return UnsignedData::FromJson(value);
  } catch (const std::invalid_argument& ex) {
    throw DecodeError::InvalidField("unsigned", ex.what());
  }
}

Timestamp ResolveOriginServerTs(const nlohmann::json& millis) {
  if (!millis.is_number_unsigned() && millis.get<std::int64_t>() < 0) {
    throw DecodeError(DecodeErrorKind::kTimestampOverflow, "origin_server_ts", "negative timestamp");
  }
  const auto value = millis.get<std::uint64_t>();
  if (!IsRepresentableTimestamp(value)) {
    throw DecodeError(DecodeErrorKind::kTimestampOverflow, "origin_server_ts",
                      std::to_string(value) + " is out of range");
  }
  return FromWireTimestamp(value);
}

std::uint64_t EncodeOriginServerTs(Timestamp instant) {
  try {
    return ToWireTimestamp(instant);
  } catch (const TimestampOverflow& ex) {
    throw EncodeError(EncodeErrorKind::kTimestampOverflow, "origin_server_ts", ex.what());
  }
}

}  // namespace detail
}  // namespace roomevents
