/*
 * 설명: 식별자 문자열 검증(시길, 로컬파트, 서버 이름, 길이)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/identifiers_test.cpp
 */
#include "roomevents/identifiers.hpp"

#include <cctype>

namespace roomevents {
namespace {
constexpr unsigned long kMaxPort = 65535;

bool IsHostnameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.';
}

bool IsIpv6LiteralChar(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
}

bool IsValidPort(std::string_view port) {
  if (port.empty() || port.size() > 5) {
    return false;
  }
  unsigned long value = 0;
  for (char c : port) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<unsigned long>(c - '0');
  }
  return value <= kMaxPort;
}

void CheckCommon(std::string_view value, char sigil, const char* kind) {
  if (value.size() > kMaxIdentifierLength) {
    throw IdentifierError(kind, "longer than 255 bytes");
  }
  if (value.empty() || value.front() != sigil) {
    throw IdentifierError(kind, std::string("must start with '") + sigil + "'");
  }
}

std::size_t ValidateServerScoped(std::string_view value, char sigil, const char* kind) {
  CheckCommon(value, sigil, kind);
  auto colon = value.find(':');
  if (colon == std::string_view::npos) {
    throw IdentifierError(kind, "missing ':' before server name");
  }
  if (colon == 1) {
    throw IdentifierError(kind, "empty localpart");
  }
  if (!IsValidServerName(value.substr(colon + 1))) {
    throw IdentifierError(kind, "invalid server name");
  }
  return colon;
}
}  // namespace

bool IsValidServerName(std::string_view server_name) {
  std::string_view host = server_name;
  std::string_view port;
  if (!server_name.empty() && server_name.front() == '[') {
    auto close = server_name.find(']');
    if (close == std::string_view::npos || close == 1) {
      return false;
    }
    for (char c : server_name.substr(1, close - 1)) {
      if (!IsIpv6LiteralChar(c)) {
        return false;
      }
    }
    auto rest = server_name.substr(close + 1);
    if (rest.empty()) {
      return true;
    }
    if (rest.front() != ':') {
      return false;
    }
    return IsValidPort(rest.substr(1));
  }

  auto colon = server_name.find(':');
  if (colon != std::string_view::npos) {
    host = server_name.substr(0, colon);
    port = server_name.substr(colon + 1);
    if (!IsValidPort(port)) {
      return false;
    }
  }
  if (host.empty()) {
    return false;
  }
  for (char c : host) {
    if (!IsHostnameChar(c)) {
      return false;
    }
  }
  return true;
}

std::string_view ServerScopedId::localpart() const {
  return std::string_view(value_).substr(1, colon_ - 1);
}

std::string_view ServerScopedId::server_name() const {
  return std::string_view(value_).substr(colon_ + 1);
}

RoomId RoomId::Parse(std::string_view value) {
  auto colon = ValidateServerScoped(value, '!', "room id");
  return RoomId(std::string(value), colon);
}

UserId UserId::Parse(std::string_view value) {
  auto colon = ValidateServerScoped(value, '@', "user id");
  return UserId(std::string(value), colon);
}

RoomAliasId RoomAliasId::Parse(std::string_view value) {
  auto colon = ValidateServerScoped(value, '#', "room alias id");
  return RoomAliasId(std::string(value), colon);
}

EventId EventId::Parse(std::string_view value) {
  CheckCommon(value, '$', "event id");
  auto colon = value.find(':');
  if (colon == std::string_view::npos) {
    if (value.size() == 1) {
      throw IdentifierError("event id", "empty opaque part");
    }
    return EventId(std::string(value), std::nullopt);
  }
  auto checked = ValidateServerScoped(value, '$', "event id");
  return EventId(std::string(value), checked);
}

std::optional<std::string_view> EventId::server_name() const {
  if (!colon_) {
    return std::nullopt;
  }
  return std::string_view(value_).substr(*colon_ + 1);
}

}  // namespace roomevents
