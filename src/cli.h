#pragma once

#include "cmds/cmd_spec.h"
#include "cmds/cmd_specs.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gemfetch {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_spec::cfg, cmd_specs::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<std::filesystem::path> config_file;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace gemfetch
