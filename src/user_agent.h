#pragma once

#include "settings.h"

#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

struct user_agent_inputs {
  std::string_view tool_version;
  std::string_view transport_version;  // e.g. "curl/7.88.1"
  std::string_view os;
  std::string_view command;
  std::vector<std::string> option_names;
  std::string session_token;
  std::string extra;
};

// "gemfetch/1.0 curl/7.88.1 (linux) command/specs options/a,b 0123456789abcdef [extra]"
std::string user_agent_format(user_agent_inputs const &inputs);

// Setting names reported in the "options/" segment: plain option keys only, never
// credential, mirror or host-scoped entries.
std::vector<std::string> user_agent_option_names(settings const &s);

// Process-wide identifying string. Built on the first call and returned unchanged
// afterwards, so the session token stays stable for the life of the process.
std::string const &user_agent_for_process(std::string_view command, settings const &s);

}  // namespace gemfetch
