/*
 * 설명: m.room.aliases, m.room.avatar 상태 콘텐츠 스키마를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/room_content_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "roomevents/identifiers.hpp"

namespace roomevents {

struct AliasesEventContent {
  static constexpr const char* kEventType = "m.room.aliases";

  std::vector<RoomAliasId> aliases;

  std::string EventType() const { return kEventType; }
  static AliasesEventContent FromParts(const std::string& event_type, const nlohmann::json& raw);
  // 스키마 불일치 시 std::invalid_argument.
  static AliasesEventContent FromJson(const nlohmann::json& value);
  nlohmann::ordered_json ToJson() const;

  bool operator==(const AliasesEventContent& other) const { return aliases == other.aliases; }
  bool operator!=(const AliasesEventContent& other) const { return !(*this == other); }
};

struct ThumbnailInfo {
  std::optional<std::uint64_t> height;
  std::optional<std::uint64_t> width;
  std::optional<std::string> mimetype;
  std::optional<std::uint64_t> size;

  static ThumbnailInfo FromJson(const nlohmann::json& value);
  nlohmann::ordered_json ToJson() const;

  bool operator==(const ThumbnailInfo& other) const;
  bool operator!=(const ThumbnailInfo& other) const { return !(*this == other); }
};

struct ImageInfo {
  std::optional<std::uint64_t> height;
  std::optional<std::uint64_t> width;
  std::optional<std::string> mimetype;
  std::optional<std::uint64_t> size;
  std::optional<ThumbnailInfo> thumbnail_info;
  std::optional<std::string> thumbnail_url;

  static ImageInfo FromJson(const nlohmann::json& value);
  nlohmann::ordered_json ToJson() const;

  bool operator==(const ImageInfo& other) const;
  bool operator!=(const ImageInfo& other) const { return !(*this == other); }
};

struct AvatarEventContent {
  static constexpr const char* kEventType = "m.room.avatar";

  std::optional<ImageInfo> info;
  std::string url;

  std::string EventType() const { return kEventType; }
  static AvatarEventContent FromParts(const std::string& event_type, const nlohmann::json& raw);
  static AvatarEventContent FromJson(const nlohmann::json& value);
  nlohmann::ordered_json ToJson() const;

  bool operator==(const AvatarEventContent& other) const { return info == other.info && url == other.url; }
  bool operator!=(const AvatarEventContent& other) const { return !(*this == other); }
};

}  // namespace roomevents
