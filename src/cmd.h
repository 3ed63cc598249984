#pragma once

#include "settings.h"
#include "util.h"

#include <memory>

namespace gemfetch {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute() = 0;

  // Create command with the process settings (config file + environment)
  template <typename config>
  static ptr_t create(config const &cfg, settings const &s);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, settings const &s) {
  return std::make_unique<typename config::cmd_t>(cfg, s);
}

}  // namespace gemfetch
