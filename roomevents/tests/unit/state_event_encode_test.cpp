#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "roomevents/any_state_event_content.hpp"
#include "roomevents/state_event.hpp"

using roomevents::AliasesEventContent;
using roomevents::AnyStateEventContent;
using roomevents::EncodeError;
using roomevents::EncodeErrorKind;
using roomevents::EventId;
using roomevents::RoomAliasId;
using roomevents::RoomId;
using roomevents::Timestamp;
using roomevents::UserId;

namespace {

using AnyEvent = roomevents::StateEvent<AnyStateEventContent>;

AliasesEventContent MakeAliases(const char* alias) {
  AliasesEventContent content;
  content.aliases.push_back(RoomAliasId::Parse(alias));
  return content;
}

AnyEvent MakeAliasesEvent(std::optional<AnyStateEventContent> prev_content) {
  return AnyEvent{MakeAliases("#somewhere:localhost"),
                  EventId::Parse("$h29iv0s8:example.com"),
                  UserId::Parse("@carl:example.com"),
                  Timestamp{} + std::chrono::milliseconds(1),
                  RoomId::Parse("!roomid:room.com"),
                  "",
                  std::move(prev_content),
                  roomevents::UnsignedData{}};
}

std::vector<std::string> Keys(const nlohmann::ordered_json& j) {
  std::vector<std::string> keys;
  for (auto it = j.begin(); it != j.end(); ++it) {
    keys.push_back(it.key());
  }
  return keys;
}

}  // namespace

TEST(StateEventEncodeTest, SerializesAliasesWithPrevContent) {
  auto event = MakeAliasesEvent(AnyStateEventContent(MakeAliases("#somewhere:localhost")));
  EXPECT_EQ(roomevents::SerializeStateEvent(event),
            R"({"type":"m.room.aliases","content":{"aliases":["#somewhere:localhost"]},)"
            R"("event_id":"$h29iv0s8:example.com","sender":"@carl:example.com","origin_server_ts":1,)"
            R"("room_id":"!roomid:room.com","state_key":"","prev_content":{"aliases":["#somewhere:localhost"]}})");
}

TEST(StateEventEncodeTest, OmitsAbsentPrevContentAndEmptyUnsigned) {
  auto encoded = roomevents::EncodeStateEvent(MakeAliasesEvent(std::nullopt));
  std::vector<std::string> expected{"type", "content", "event_id", "sender", "origin_server_ts", "room_id",
                                    "state_key"};
  EXPECT_EQ(Keys(encoded), expected);
  EXPECT_FALSE(encoded.contains("prev_content"));
  EXPECT_FALSE(encoded.contains("unsigned"));
}

TEST(StateEventEncodeTest, WritesNonEmptyUnsignedLast) {
  auto event = MakeAliasesEvent(AnyStateEventContent(MakeAliases("#old:localhost")));
  event.unsigned_data.age = 42;
  auto encoded = roomevents::EncodeStateEvent(event);
  std::vector<std::string> expected{"type",      "content",   "event_id",     "sender",  "origin_server_ts",
                                    "room_id",   "state_key", "prev_content", "unsigned"};
  EXPECT_EQ(Keys(encoded), expected);
  EXPECT_EQ(encoded["unsigned"].dump(), R"({"age":42})");
}

TEST(StateEventEncodeTest, ExampleRoundTripsThroughTheWire) {
  const std::string wire =
      R"({"content":{"aliases":["#a:x"]},"event_id":"$1:x","origin_server_ts":1,)"
      R"("prev_content":{"aliases":["#b:x"]},"room_id":"!r:x","sender":"@u:x","state_key":"","type":"m.room.aliases"})";
  auto event = roomevents::ParseStateEvent<AnyStateEventContent>(wire);
  EXPECT_EQ(roomevents::SerializeStateEvent(event),
            R"({"type":"m.room.aliases","content":{"aliases":["#a:x"]},"event_id":"$1:x","sender":"@u:x",)"
            R"("origin_server_ts":1,"room_id":"!r:x","state_key":"","prev_content":{"aliases":["#b:x"]}})");
}

TEST(StateEventEncodeTest, DecodeOfEncodeIsIdentity) {
  roomevents::AvatarEventContent avatar;
  avatar.url = "mxc://example.com/avatar";
  roomevents::ImageInfo info;
  info.width = 64;
  info.height = 64;
  info.thumbnail_url = "mxc://example.com/thumb";
  avatar.info = info;

  AnyEvent event{avatar,
                 EventId::Parse("$acR1l0raoZnm60CBwAVgqbZqoO"),
                 UserId::Parse("@alice:example.org"),
                 Timestamp{} + std::chrono::milliseconds(1577836800123LL),
                 RoomId::Parse("!room:example.org"),
                 "",
                 std::nullopt,
                 roomevents::UnsignedData{}};
  event.unsigned_data.age = -3;
  event.unsigned_data.transaction_id = "m1234";
  event.unsigned_data.extra["x.custom"] = {{"k", "v"}};

  auto decoded = roomevents::ParseStateEvent<AnyStateEventContent>(roomevents::SerializeStateEvent(event));
  EXPECT_EQ(decoded, event);

  auto with_prev = MakeAliasesEvent(AnyStateEventContent(MakeAliases("#before:localhost")));
  with_prev.state_key = "@carl:example.com";
  EXPECT_EQ(roomevents::ParseStateEvent<AnyStateEventContent>(roomevents::SerializeStateEvent(with_prev)), with_prev);
}

TEST(StateEventEncodeTest, EpochEncodesAsZero) {
  auto event = MakeAliasesEvent(std::nullopt);
  event.origin_server_ts = Timestamp{};
  EXPECT_EQ(roomevents::EncodeStateEvent(event)["origin_server_ts"], 0);
}

TEST(StateEventEncodeTest, PreEpochTimestampFailsToEncode) {
  auto event = MakeAliasesEvent(std::nullopt);
  event.origin_server_ts = Timestamp{} - std::chrono::milliseconds(1);
  try {
    roomevents::EncodeStateEvent(event);
    FAIL() << "pre-epoch timestamp encoded";
  } catch (const EncodeError& ex) {
    EXPECT_EQ(ex.kind, EncodeErrorKind::kTimestampOverflow);
    EXPECT_EQ(ex.field, "origin_server_ts");
  }
}

TEST(StateEventEncodeTest, TypedEnvelopeEncodesTheSameShape) {
  roomevents::StateEvent<AliasesEventContent> typed{MakeAliases("#somewhere:localhost"),
                                                    EventId::Parse("$h29iv0s8:example.com"),
                                                    UserId::Parse("@carl:example.com"),
                                                    Timestamp{} + std::chrono::milliseconds(1),
                                                    RoomId::Parse("!roomid:room.com"),
                                                    "",
                                                    std::nullopt,
                                                    roomevents::UnsignedData{}};
  EXPECT_EQ(roomevents::SerializeStateEvent(typed), roomevents::SerializeStateEvent(MakeAliasesEvent(std::nullopt)));
}
