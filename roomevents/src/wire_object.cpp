/*
 * 설명: SAX 파서로 최상위 키를 입력 순서대로 수집해 중복 키를 보존한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: roomevents/tests/unit/wire_object_test.cpp
 */
#include "roomevents/wire_object.hpp"

#include "roomevents/errors.hpp"

namespace roomevents {
namespace {

// 최상위 엔트리마다 값을 따로 만든다. 하위 객체의 중복 키는 스키마 해석기의 몫이다.
class WireObjectCollector : public nlohmann::json::json_sax_t {
 public:
  explicit WireObjectCollector(WireObject& out) : out_(out) {}

  bool null() override { return Store(nullptr); }
  bool boolean(bool val) override { return Store(val); }
  bool number_integer(number_integer_t val) override { return Store(val); }
  bool number_unsigned(number_unsigned_t val) override { return Store(val); }
  bool number_float(number_float_t val, const string_t&) override { return Store(val); }
  bool string(string_t& val) override { return Store(val); }

  // JSON 텍스트에서는 호출되지 않는다.
  bool binary(binary_t&) override { return false; }

  bool start_object(std::size_t) override {
    if (!started_) {
      started_ = true;
      return true;
    }
    stack_.push_back(Place(nlohmann::json::object()));
    return true;
  }

  bool key(string_t& val) override {
    if (stack_.empty()) {
      out_.push_back(WireEntry{val, nullptr});
      return true;
    }
    pending_ = &(*stack_.back())[val];
    return true;
  }

  bool end_object() override {
    if (!stack_.empty()) {
      stack_.pop_back();
    }
    return true;
  }

  bool start_array(std::size_t) override {
    if (!started_) {
      not_object_ = true;
      return false;
    }
    stack_.push_back(Place(nlohmann::json::array()));
    return true;
  }

  bool end_array() override {
    stack_.pop_back();
    return true;
  }

  bool parse_error(std::size_t, const std::string&, const nlohmann::json::exception& ex) override {
    error_ = ex.what();
    return false;
  }

  bool not_object() const { return not_object_; }
  const std::string& error() const { return error_; }

 private:
  bool Store(nlohmann::json value) {
    if (!started_) {
      not_object_ = true;
      return false;
    }
    Place(std::move(value));
    return true;
  }

  nlohmann::json* Place(nlohmann::json value) {
    if (stack_.empty()) {
      out_.back().value = std::move(value);
      return &out_.back().value;
    }
    nlohmann::json& parent = *stack_.back();
    if (parent.is_array()) {
      parent.push_back(std::move(value));
      return &parent.back();
    }
    *pending_ = std::move(value);
    return pending_;
  }

  WireObject& out_;
  std::vector<nlohmann::json*> stack_;
  nlohmann::json* pending_{nullptr};
  bool started_{false};
  bool not_object_{false};
  std::string error_;
};

}  // namespace

WireObject ReadWireObject(std::string_view text) {
  WireObject entries;
  WireObjectCollector collector(entries);
  if (!nlohmann::json::sax_parse(text.begin(), text.end(), &collector)) {
    if (collector.not_object()) {
      throw DecodeError(DecodeErrorKind::kNotAnObject, "", "top-level JSON value is not an object");
    }
    throw DecodeError(DecodeErrorKind::kSyntax, "", collector.error());
  }
  return entries;
}

WireObject ToWireObject(const nlohmann::json& object) {
  if (!object.is_object()) {
    throw DecodeError(DecodeErrorKind::kNotAnObject, "", std::string("expected object, got ") + object.type_name());
  }
  WireObject entries;
  entries.reserve(object.size());
  for (auto it = object.begin(); it != object.end(); ++it) {
    entries.push_back(WireEntry{it.key(), it.value()});
  }
  return entries;
}

}  // namespace roomevents
