#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "roomevents/tool_app.hpp"

namespace {

const char* kAliasesLine =
    R"({"content":{"aliases":["#a:x"]},"event_id":"$1:x","origin_server_ts":1,"room_id":"!r:x",)"
    R"("sender":"@u:x","state_key":"","type":"m.room.aliases"})";

const char* kAliasesCanonical =
    R"({"type":"m.room.aliases","content":{"aliases":["#a:x"]},"event_id":"$1:x","sender":"@u:x",)"
    R"("origin_server_ts":1,"room_id":"!r:x","state_key":""})";

const char* kAvatarLine =
    R"({"type":"m.room.avatar","state_key":"","room_id":"!r:x","sender":"@u:x","origin_server_ts":2,)"
    R"("event_id":"$2:x","content":{"url":"mxc://x/a"}})";

std::vector<std::string> Lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

roomevents::ToolConfig DefaultConfig() {
  roomevents::ToolConfig config;
  config.strict_fields = false;
  config.workers = 2;
  config.log_level = "info";
  return config;
}

}  // namespace

TEST(ToolAppTest, RewritesEveryLineCanonically) {
  std::istringstream in(std::string(kAliasesLine) + "\n\n" + kAvatarLine + "\n");
  std::ostringstream out;
  std::ostringstream log;
  roomevents::ToolApp app(DefaultConfig());

  EXPECT_EQ(app.Run(in, out, log), 0);
  auto written = Lines(out.str());
  ASSERT_EQ(written.size(), 2u);
  EXPECT_EQ(written[0], kAliasesCanonical);
  EXPECT_EQ(nlohmann::json::parse(written[1])["type"], "m.room.avatar");

  auto log_lines = Lines(log.str());
  ASSERT_EQ(log_lines.size(), 1u);
  auto summary = nlohmann::json::parse(log_lines[0]);
  EXPECT_EQ(summary["eventName"], "state_event.batch_done");
  EXPECT_EQ(summary["message"], "2 decoded, 0 decode errors, 0 encode errors");
}

TEST(ToolAppTest, BadLinesFailAloneAndSetExitCode) {
  const std::string invalid_utf8 = std::string(R"({"type":")") + '\xff' + R"("})";
  std::istringstream in(std::string(kAliasesLine) + "\n" + invalid_utf8 + "\n[]\n" + kAvatarLine + "\n");
  std::ostringstream out;
  std::ostringstream log;
  roomevents::ToolApp app(DefaultConfig());

  EXPECT_EQ(app.Run(in, out, log), 1);
  auto written = Lines(out.str());
  ASSERT_EQ(written.size(), 2u);
  EXPECT_EQ(written[0], kAliasesCanonical);
  EXPECT_EQ(nlohmann::json::parse(written[1])["event_id"], "$2:x");

  auto log_lines = Lines(log.str());
  ASSERT_EQ(log_lines.size(), 3u);
  int failures = 0;
  for (const auto& text : log_lines) {
    auto entry = nlohmann::json::parse(text);
    if (entry["eventName"] == "state_event.decode_failed") {
      ++failures;
    } else {
      EXPECT_EQ(entry["message"], "4 decoded, 2 decode errors, 0 encode errors");
    }
  }
  EXPECT_EQ(failures, 2);
}

TEST(ToolAppTest, StrictConfigRejectsUnknownKeys) {
  auto config = DefaultConfig();
  config.strict_fields = true;
  auto event = nlohmann::json::parse(kAliasesLine);
  event["x.extra"] = true;
  std::istringstream in(event.dump() + "\n");
  std::ostringstream out;
  std::ostringstream log;
  roomevents::ToolApp app(config);

  EXPECT_EQ(app.Run(in, out, log), 1);
  EXPECT_TRUE(out.str().empty());
}
