#include "user_agent.h"

#include "libcurl_util.h"
#include "platform.h"
#include "util.h"
#include "version.h"

#include <mutex>

namespace gemfetch {

std::string user_agent_format(user_agent_inputs const &inputs) {
  std::string result{ "gemfetch/" };
  result.append(inputs.tool_version);
  if (!inputs.transport_version.empty()) {
    result.push_back(' ');
    result.append(inputs.transport_version);
  }
  result.append(" (");
  result.append(inputs.os);
  result.append(")");
  if (!inputs.command.empty()) {
    result.append(" command/");
    result.append(inputs.command);
  }
  if (!inputs.option_names.empty()) {
    result.append(" options/");
    result.append(util_join(inputs.option_names, ","));
  }
  result.push_back(' ');
  result.append(inputs.session_token);
  if (!inputs.extra.empty()) {
    result.push_back(' ');
    result.append(inputs.extra);
  }
  return result;
}

std::vector<std::string> user_agent_option_names(settings const &s) {
  std::vector<std::string> result;
  for (auto const &key : s.keys()) {
    if (key.find_first_of("./:") != std::string::npos) { continue; }
    result.push_back(key);
  }
  return result;
}

std::string const &user_agent_for_process(std::string_view command, settings const &s) {
  static std::once_flag once;
  static std::string agent;

  std::call_once(once, [&] {
    std::string const transport{ libcurl_version_string() };

    agent = user_agent_format({ .tool_version = gemfetch_version(),
                                .transport_version = transport,
                                .os = platform::os_name(),
                                .command = command,
                                .option_names = user_agent_option_names(s),
                                .session_token = util_random_hex(8),
                                .extra = s.get("user_agent").value_or("") });
  });

  return agent;
}

}  // namespace gemfetch
