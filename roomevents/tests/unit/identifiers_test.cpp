#include <string>

#include <gtest/gtest.h>

#include "roomevents/identifiers.hpp"

using roomevents::EventId;
using roomevents::IdentifierError;
using roomevents::RoomAliasId;
using roomevents::RoomId;
using roomevents::UserId;

TEST(IdentifiersTest, ParsesServerScopedIds) {
  auto room = RoomId::Parse("!roomid:room.com");
  EXPECT_EQ(room.str(), "!roomid:room.com");
  EXPECT_EQ(room.localpart(), "roomid");
  EXPECT_EQ(room.server_name(), "room.com");

  auto user = UserId::Parse("@carl:example.com:8448");
  EXPECT_EQ(user.localpart(), "carl");
  EXPECT_EQ(user.server_name(), "example.com:8448");

  auto alias = RoomAliasId::Parse("#somewhere:[::1]:8008");
  EXPECT_EQ(alias.server_name(), "[::1]:8008");
}

TEST(IdentifiersTest, RejectsWrongSigil) {
  EXPECT_THROW(RoomId::Parse("@roomid:room.com"), IdentifierError);
  EXPECT_THROW(UserId::Parse("carl:example.com"), IdentifierError);
  EXPECT_THROW(RoomAliasId::Parse(""), IdentifierError);
}

TEST(IdentifiersTest, RejectsMissingOrInvalidServerName) {
  EXPECT_THROW(UserId::Parse("@carl"), IdentifierError);
  EXPECT_THROW(UserId::Parse("@carl:"), IdentifierError);
  EXPECT_THROW(UserId::Parse("@carl:exa mple.com"), IdentifierError);
  EXPECT_THROW(UserId::Parse("@carl:example.com:99999"), IdentifierError);
  EXPECT_THROW(UserId::Parse("@carl:example.com:port"), IdentifierError);
  EXPECT_THROW(RoomAliasId::Parse("#a:[::1"), IdentifierError);
}

TEST(IdentifiersTest, RejectsEmptyLocalpart) {
  EXPECT_THROW(RoomId::Parse("!:room.com"), IdentifierError);
}

TEST(IdentifiersTest, RejectsOverlongIds) {
  std::string id = "@" + std::string(250, 'a') + ":example.com";
  try {
    UserId::Parse(id);
    FAIL() << "overlong id accepted";
  } catch (const IdentifierError& ex) {
    EXPECT_EQ(ex.kind, "user id");
  }
}

TEST(IdentifiersTest, EventIdAcceptsBothFormats) {
  auto legacy = EventId::Parse("$h29iv0s8:example.com");
  ASSERT_TRUE(legacy.server_name().has_value());
  EXPECT_EQ(*legacy.server_name(), "example.com");

  auto hashed = EventId::Parse("$acR1l0raoZnm60CBwAVgqbZqoO/mYU81xysh1u7XcJk");
  EXPECT_FALSE(hashed.server_name().has_value());

  EXPECT_THROW(EventId::Parse("$"), IdentifierError);
  EXPECT_THROW(EventId::Parse("$abc:"), IdentifierError);
  EXPECT_THROW(EventId::Parse("h29iv0s8:example.com"), IdentifierError);
}

TEST(IdentifiersTest, EqualityComparesFullString) {
  EXPECT_EQ(UserId::Parse("@carl:example.com"), UserId::Parse("@carl:example.com"));
  EXPECT_NE(UserId::Parse("@carl:example.com"), UserId::Parse("@carl:example.org"));
}
