#include "user_agent.h"

#include "doctest.h"

namespace gemfetch {

TEST_CASE("user_agent_format") {
  auto const agent{ user_agent_format({ .tool_version = "1.0",
                                        .transport_version = "curl/8.5.0",
                                        .os = "linux",
                                        .command = "specs",
                                        .option_names = { "api_timeout", "max_retries" },
                                        .session_token = "0123456789abcdef",
                                        .extra = "ci" }) };
  CHECK(agent ==
        "gemfetch/1.0 curl/8.5.0 (linux) command/specs options/api_timeout,max_retries "
        "0123456789abcdef ci");
}

TEST_CASE("user_agent_format omits empty segments") {
  auto const agent{ user_agent_format(
      { .tool_version = "1.0", .os = "darwin", .session_token = "ff" }) };
  CHECK(agent == "gemfetch/1.0 (darwin) ff");
}

TEST_CASE("user_agent_option_names skips host scoped keys") {
  settings const s{ { { "api_timeout", "5" },
                      { "gems.example.com", "u:p" },
                      { "https://gems.example.com/", "u:p" },
                      { "mirror./x", "y" } } };
  auto const names{ user_agent_option_names(s) };
  REQUIRE(names.size() == 1);
  CHECK(names[0] == "api_timeout");
}

TEST_CASE("user_agent_for_process is stable") {
  auto const &first{ user_agent_for_process("specs", settings{}) };
  auto const &second{ user_agent_for_process("spec", settings{ { { "x", "y" } } }) };
  CHECK(&first == &second);
  CHECK(first.starts_with("gemfetch/"));
}

}  // namespace gemfetch
