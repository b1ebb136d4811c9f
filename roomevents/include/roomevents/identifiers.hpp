/*
 * 설명: 이벤트/룸/사용자/룸 별칭 식별자 값 타입과 검증을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/identifiers_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace roomevents {

constexpr std::size_t kMaxIdentifierLength = 255;

class IdentifierError : public std::invalid_argument {
 public:
  IdentifierError(std::string kind, const std::string& message)
      : std::invalid_argument(kind + ": " + message), kind(std::move(kind)) {}
  std::string kind;
};

// `sigil localpart ':' server_name` 형태의 식별자 공통부.
class ServerScopedId {
 public:
  const std::string& str() const { return value_; }
  std::string_view localpart() const;
  std::string_view server_name() const;

 protected:
  ServerScopedId(std::string value, std::size_t colon) : value_(std::move(value)), colon_(colon) {}

  std::string value_;
  std::size_t colon_;
};

class RoomId : public ServerScopedId {
 public:
  static RoomId Parse(std::string_view value);
  bool operator==(const RoomId& other) const { return value_ == other.value_; }
  bool operator!=(const RoomId& other) const { return !(*this == other); }

 private:
  using ServerScopedId::ServerScopedId;
};

class UserId : public ServerScopedId {
 public:
  static UserId Parse(std::string_view value);
  bool operator==(const UserId& other) const { return value_ == other.value_; }
  bool operator!=(const UserId& other) const { return !(*this == other); }

 private:
  using ServerScopedId::ServerScopedId;
};

class RoomAliasId : public ServerScopedId {
 public:
  static RoomAliasId Parse(std::string_view value);
  bool operator==(const RoomAliasId& other) const { return value_ == other.value_; }
  bool operator!=(const RoomAliasId& other) const { return !(*this == other); }

 private:
  using ServerScopedId::ServerScopedId;
};

// `$local:server` (룸 버전 1, 2) 또는 서버 이름이 없는 해시 기반 `$opaque` 형태.
class EventId {
 public:
  static EventId Parse(std::string_view value);

  const std::string& str() const { return value_; }
  std::optional<std::string_view> server_name() const;

  bool operator==(const EventId& other) const { return value_ == other.value_; }
  bool operator!=(const EventId& other) const { return !(*this == other); }

 private:
  EventId(std::string value, std::optional<std::size_t> colon) : value_(std::move(value)), colon_(colon) {}

  std::string value_;
  std::optional<std::size_t> colon_;
};

bool IsValidServerName(std::string_view server_name);

}  // namespace roomevents
