#pragma once

#include "cmd.h"
#include "cmd_common.h"
#include "spec_index.h"

#include <functional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace gemfetch {

class cmd_specs : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_specs> {
    std::vector<std::string> names;  // empty: whole registry via the full index
    std::vector<std::string> sources;
    bool show_dependencies{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_specs(cfg cfg, settings const &s);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

  // One independent session per source, run concurrently. The first failure
  // propagates; results are in source order.
  static std::vector<spec_index> fetch_all(cfg const &c,
                                           settings const &s,
                                           transport_factory_t const &make_transport);

  // "name (version[-platform])" per variant, names sorted, optionally followed by
  // indented runtime dependencies.
  static std::vector<std::string> format(spec_index const &index, bool show_dependencies);

 private:
  cfg cfg_;
  settings const &settings_;
};

}  // namespace gemfetch
