/*
 * 설명: 상태 이벤트 엔벨로프와 판별자 순서에 무관한 디코더/인코더를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/state_event_decode_test.cpp, roomevents/tests/unit/state_event_encode_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "roomevents/errors.hpp"
#include "roomevents/identifiers.hpp"
#include "roomevents/timestamp.hpp"
#include "roomevents/unsigned_data.hpp"
#include "roomevents/wire_object.hpp"

namespace roomevents {

// 콘텐츠 타입 C가 제공해야 하는 것:
//   std::string EventType() const;
//   static C FromParts(const std::string& event_type, const nlohmann::json& raw);  // 실패 시 ContentError
//   nlohmann::ordered_json ToJson() const;
//   bool operator==(const C&) const;
template <typename C>
struct StateEvent {
  C content;
  EventId event_id;
  UserId sender;
  Timestamp origin_server_ts;
  RoomId room_id;
  // room_id, type과 함께 덮어쓰기 키가 된다. 보통 빈 문자열이다.
  std::string state_key;
  std::optional<C> prev_content;
  UnsignedData unsigned_data;

  bool operator==(const StateEvent& other) const {
    return content == other.content && event_id == other.event_id && sender == other.sender &&
           origin_server_ts == other.origin_server_ts && room_id == other.room_id &&
           state_key == other.state_key && prev_content == other.prev_content &&
           unsigned_data == other.unsigned_data;
  }
  bool operator!=(const StateEvent& other) const { return !(*this == other); }
};

struct DecodeOptions {
  // 알 수 없는 최상위 키를 무시하지 않고 거부한다.
  bool reject_unknown_fields{false};
};

namespace detail {

enum class Field {
  kType,
  kContent,
  kEventId,
  kSender,
  kOriginServerTs,
  kRoomId,
  kStateKey,
  kPrevContent,
  kUnsigned,
  kUnknown,
};

Field ClassifyField(const std::string& key);

std::string ParseEventType(const nlohmann::json& value);
EventId ParseEventId(const nlohmann::json& value);
UserId ParseSender(const nlohmann::json& value);
RoomId ParseRoomId(const nlohmann::json& value);
std::string ParseStateKey(const nlohmann::json& value);
// 정수인지만 본다. 부호와 범위는 누락 검사 뒤 ResolveOriginServerTs가 판정한다.
nlohmann::json ParseOriginServerTs(const nlohmann::json& value);
UnsignedData ParseUnsigned(const nlohmann::json& value);

Timestamp ResolveOriginServerTs(const nlohmann::json& millis);
std::uint64_t EncodeOriginServerTs(Timestamp instant);

template <typename T, typename Parser>
void RecordOnce(std::optional<T>& slot, const char* name, const nlohmann::json& value, Parser parse) {
  if (slot) {
    throw DecodeError::DuplicateField(name);
  }
  slot = parse(value);
}

inline void RecordRawOnce(const nlohmann::json*& slot, const char* name, const nlohmann::json& value) {
  if (slot) {
    throw DecodeError::DuplicateField(name);
  }
  slot = &value;
}

template <typename T>
T Require(std::optional<T>& slot, const char* name) {
  if (!slot) {
    throw DecodeError::MissingField(name);
  }
  return std::move(*slot);
}

template <typename C>
C ResolveContent(const std::string& event_type, const nlohmann::json& raw, const char* field) {
  try {
    return C::FromParts(event_type, raw);
  } catch (const ContentError& ex) {
    auto kind = ex.unknown_type ? DecodeErrorKind::kUnknownEventType : DecodeErrorKind::kContent;
    throw DecodeError(kind, field, ex.what(), event_type);
  }
}

}  // namespace detail

// content/prev_content는 type을 볼 때까지 원시 값으로 보관했다가 순회가 끝난 뒤 해석한다.
template <typename C>
StateEvent<C> DecodeStateEvent(const WireObject& object, const DecodeOptions& options = {}) {
  using detail::Field;

  std::optional<std::string> event_type;
  const nlohmann::json* raw_content = nullptr;
  std::optional<EventId> event_id;
  std::optional<UserId> sender;
  std::optional<nlohmann::json> origin_server_ts;
  std::optional<RoomId> room_id;
  std::optional<std::string> state_key;
  const nlohmann::json* raw_prev_content = nullptr;
  std::optional<UnsignedData> unsigned_data;

  for (const auto& entry : object) {
    switch (detail::ClassifyField(entry.key)) {
      case Field::kType:
        detail::RecordOnce(event_type, "type", entry.value, detail::ParseEventType);
        break;
      case Field::kContent:
        detail::RecordRawOnce(raw_content, "content", entry.value);
        break;
      case Field::kEventId:
        detail::RecordOnce(event_id, "event_id", entry.value, detail::ParseEventId);
        break;
      case Field::kSender:
        detail::RecordOnce(sender, "sender", entry.value, detail::ParseSender);
        break;
      case Field::kOriginServerTs:
        detail::RecordOnce(origin_server_ts, "origin_server_ts", entry.value, detail::ParseOriginServerTs);
        break;
      case Field::kRoomId:
        detail::RecordOnce(room_id, "room_id", entry.value, detail::ParseRoomId);
        break;
      case Field::kStateKey:
        detail::RecordOnce(state_key, "state_key", entry.value, detail::ParseStateKey);
        break;
      case Field::kPrevContent:
        detail::RecordRawOnce(raw_prev_content, "prev_content", entry.value);
        break;
      case Field::kUnsigned:
        detail::RecordOnce(unsigned_data, "unsigned", entry.value, detail::ParseUnsigned);
        break;
      case Field::kUnknown:
        if (options.reject_unknown_fields) {
          throw DecodeError(DecodeErrorKind::kUnknownField, entry.key, "");
        }
        break;
    }
  }

  if (!event_type) {
    throw DecodeError::MissingField("type");
  }
  if (!raw_content) {
    throw DecodeError::MissingField("content");
  }
  C content = detail::ResolveContent<C>(*event_type, *raw_content, "content");

  std::optional<C> prev_content;
  if (raw_prev_content) {
    prev_content = detail::ResolveContent<C>(*event_type, *raw_prev_content, "prev_content");
  }

  EventId resolved_event_id = detail::Require(event_id, "event_id");
  UserId resolved_sender = detail::Require(sender, "sender");
  nlohmann::json millis = detail::Require(origin_server_ts, "origin_server_ts");
  RoomId resolved_room_id = detail::Require(room_id, "room_id");
  std::string resolved_state_key = detail::Require(state_key, "state_key");

  return StateEvent<C>{std::move(content),
                       std::move(resolved_event_id),
                       std::move(resolved_sender),
                       detail::ResolveOriginServerTs(millis),
                       std::move(resolved_room_id),
                       std::move(resolved_state_key),
                       std::move(prev_content),
                       unsigned_data ? std::move(*unsigned_data) : UnsignedData{}};
}

template <typename C>
StateEvent<C> ParseStateEvent(std::string_view text, const DecodeOptions& options = {}) {
  return DecodeStateEvent<C>(ReadWireObject(text), options);
}

template <typename C>
StateEvent<C> StateEventFromJson(const nlohmann::json& object, const DecodeOptions& options = {}) {
  return DecodeStateEvent<C>(ToWireObject(object), options);
}

// 필드 순서는 고정이다. prev_content는 있을 때만, unsigned는 비어 있지 않을 때만 쓴다.
template <typename C>
nlohmann::ordered_json EncodeStateEvent(const StateEvent<C>& event) {
  const std::uint64_t timestamp = detail::EncodeOriginServerTs(event.origin_server_ts);

  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  j["type"] = event.content.EventType();
  j["content"] = event.content.ToJson();
  j["event_id"] = event.event_id.str();
  j["sender"] = event.sender.str();
  j["origin_server_ts"] = timestamp;
  j["room_id"] = event.room_id.str();
  j["state_key"] = event.state_key;
  if (event.prev_content) {
    j["prev_content"] = event.prev_content->ToJson();
  }
  if (!event.unsigned_data.IsEmpty()) {
    j["unsigned"] = event.unsigned_data.ToJson();
  }
  return j;
}

template <typename C>
std::string SerializeStateEvent(const StateEvent<C>& event) {
  return EncodeStateEvent(event).dump();
}

}  // namespace roomevents
