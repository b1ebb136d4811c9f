/*
 * 설명: 룸 상태 콘텐츠 스키마의 JSON 해석과 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/room_content_test.cpp
 */
#include "roomevents/room_content.hpp"

#include <stdexcept>

#include "roomevents/errors.hpp"
#include "roomevents/timestamp.hpp"

namespace roomevents {
namespace {
void RequireObject(const nlohmann::json& value, const char* what) {
  if (!value.is_object()) {
    throw std::invalid_argument(std::string(what) + " must be an object");
  }
}

std::optional<std::uint64_t> OptionalUInt(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number_integer() || (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
    throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
  }
  auto value = it->get<std::uint64_t>();
  if (value > kMaxWireTimestamp) {
    throw std::invalid_argument(std::string(key) + " exceeds the safe integer range");
  }
  return value;
}

std::optional<std::string> OptionalString(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

template <typename T>
void PutOptional(nlohmann::ordered_json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

// 판별자 확인과 스키마 오류 변환은 모든 스키마가 같다.
template <typename Content>
Content ParseContent(const std::string& event_type, const nlohmann::json& raw) {
  if (event_type != Content::kEventType) {
    throw ContentError(event_type, "expected event type " + std::string(Content::kEventType), true);
  }
  try {
    return Content::FromJson(raw);
  } catch (const std::invalid_argument& ex) {
    throw ContentError(event_type, ex.what());
  }
}
}  // namespace

AliasesEventContent AliasesEventContent::FromParts(const std::string& event_type, const nlohmann::json& raw) {
  return ParseContent<AliasesEventContent>(event_type, raw);
}

AliasesEventContent AliasesEventContent::FromJson(const nlohmann::json& value) {
  RequireObject(value, "m.room.aliases content");
  auto it = value.find("aliases");
  if (it == value.end()) {
    throw std::invalid_argument("missing field `aliases`");
  }
  if (!it->is_array()) {
    throw std::invalid_argument("aliases must be an array");
  }
  AliasesEventContent content;
  content.aliases.reserve(it->size());
  for (const auto& alias : *it) {
    if (!alias.is_string()) {
      throw std::invalid_argument("aliases must contain strings");
    }
    content.aliases.push_back(RoomAliasId::Parse(alias.get_ref<const std::string&>()));
  }
  return content;
}

nlohmann::ordered_json AliasesEventContent::ToJson() const {
  nlohmann::ordered_json list = nlohmann::ordered_json::array();
  for (const auto& alias : aliases) {
    list.push_back(alias.str());
  }
  return nlohmann::ordered_json{{"aliases", list}};
}

ThumbnailInfo ThumbnailInfo::FromJson(const nlohmann::json& value) {
  RequireObject(value, "thumbnail_info");
  ThumbnailInfo info;
  info.height = OptionalUInt(value, "h");
  info.width = OptionalUInt(value, "w");
  info.mimetype = OptionalString(value, "mimetype");
  info.size = OptionalUInt(value, "size");
  return info;
}

nlohmann::ordered_json ThumbnailInfo::ToJson() const {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  PutOptional(j, "h", height);
  PutOptional(j, "w", width);
  PutOptional(j, "mimetype", mimetype);
  PutOptional(j, "size", size);
  return j;
}

bool ThumbnailInfo::operator==(const ThumbnailInfo& other) const {
  return height == other.height && width == other.width && mimetype == other.mimetype && size == other.size;
}

ImageInfo ImageInfo::FromJson(const nlohmann::json& value) {
  RequireObject(value, "info");
  ImageInfo info;
  info.height = OptionalUInt(value, "h");
  info.width = OptionalUInt(value, "w");
  info.mimetype = OptionalString(value, "mimetype");
  info.size = OptionalUInt(value, "size");
  auto thumb = value.find("thumbnail_info");
  if (thumb != value.end() && !thumb->is_null()) {
    info.thumbnail_info = ThumbnailInfo::FromJson(*thumb);
  }
  info.thumbnail_url = OptionalString(value, "thumbnail_url");
  return info;
}

nlohmann::ordered_json ImageInfo::ToJson() const {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  PutOptional(j, "h", height);
  PutOptional(j, "w", width);
  PutOptional(j, "mimetype", mimetype);
  PutOptional(j, "size", size);
  if (thumbnail_info) {
    j["thumbnail_info"] = thumbnail_info->ToJson();
  }
  PutOptional(j, "thumbnail_url", thumbnail_url);
  return j;
}

bool ImageInfo::operator==(const ImageInfo& other) const {
  return height == other.height && width == other.width && mimetype == other.mimetype && size == other.size &&
         thumbnail_info == other.thumbnail_info && thumbnail_url == other.thumbnail_url;
}

AvatarEventContent AvatarEventContent::FromParts(const std::string& event_type, const nlohmann::json& raw) {
  return ParseContent<AvatarEventContent>(event_type, raw);
}

AvatarEventContent AvatarEventContent::FromJson(const nlohmann::json& value) {
  RequireObject(value, "m.room.avatar content");
  AvatarEventContent content;
  auto url = OptionalString(value, "url");
  if (!url) {
    throw std::invalid_argument("missing field `url`");
  }
  content.url = std::move(*url);
  auto info = value.find("info");
  if (info != value.end() && !info->is_null()) {
    content.info = ImageInfo::FromJson(*info);
  }
  return content;
}

nlohmann::ordered_json AvatarEventContent::ToJson() const {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  if (info) {
    j["info"] = info->ToJson();
  }
  j["url"] = url;
  return j;
}

}  // namespace roomevents
