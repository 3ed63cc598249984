#include "cli.h"
#include "fetch_error.h"
#include "libcurl_util.h"
#include "platform.h"
#include "settings.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  gemfetch::tui::init();

  auto args{ gemfetch::cli_parse(argc, argv) };
  gemfetch::tui::configure_trace_outputs(args.trace_outputs);
  gemfetch::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      gemfetch::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    gemfetch::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  try {
    gemfetch::libcurl_ensure_initialized();
    auto const settings{ gemfetch::settings::load(args.config_file,
                                                  gemfetch::platform::get_environment()) };

    auto cmd{ std::visit(
        [&](auto const &cfg) { return gemfetch::cmd::create(cfg, settings); },
        *args.cmd_cfg) };
    cmd->execute();
  } catch (gemfetch::fetch_error const &ex) {
    gemfetch::tui::error("%s", ex.what());
    return EXIT_FAILURE;
  } catch (std::exception const &ex) {
    gemfetch::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
