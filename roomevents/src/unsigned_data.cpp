/*
 * 설명: unsigned 부가 데이터의 JSON 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/unsigned_data_test.cpp
 */
#include "roomevents/unsigned_data.hpp"

#include <stdexcept>

#include "roomevents/timestamp.hpp"

namespace roomevents {
namespace {
constexpr std::int64_t kMaxSafeInteger = static_cast<std::int64_t>(kMaxWireTimestamp);

std::int64_t ParseAge(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    auto age = value.get<std::uint64_t>();
    if (age > static_cast<std::uint64_t>(kMaxSafeInteger)) {
      throw std::invalid_argument("age out of range");
    }
    return static_cast<std::int64_t>(age);
  }
  if (value.is_number_integer()) {
    auto age = value.get<std::int64_t>();
    if (age < -kMaxSafeInteger) {
      throw std::invalid_argument("age out of range");
    }
    return age;
  }
  throw std::invalid_argument("age must be an integer");
}
}  // namespace

bool UnsignedData::IsEmpty() const {
  return !age && !transaction_id && extra.empty();
}

UnsignedData UnsignedData::FromJson(const nlohmann::json& value) {
  if (!value.is_object()) {
    throw std::invalid_argument("unsigned must be an object");
  }
  UnsignedData data;
  for (auto it = value.begin(); it != value.end(); ++it) {
    if (it.key() == "age") {
      data.age = ParseAge(it.value());
    } else if (it.key() == "transaction_id") {
      if (!it.value().is_string()) {
        throw std::invalid_argument("transaction_id must be a string");
      }
      data.transaction_id = it.value().get<std::string>();
    } else {
      data.extra[it.key()] = it.value();
    }
  }
  return data;
}

nlohmann::ordered_json UnsignedData::ToJson() const {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  if (age) {
    j["age"] = *age;
  }
  if (transaction_id) {
    j["transaction_id"] = *transaction_id;
  }
  for (auto it = extra.begin(); it != extra.end(); ++it) {
    j[it.key()] = nlohmann::ordered_json(it.value());
  }
  return j;
}

bool UnsignedData::operator==(const UnsignedData& other) const {
  return age == other.age && transaction_id == other.transaction_id && extra == other.extra;
}

}  // namespace roomevents
