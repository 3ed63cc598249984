#include "cmd_specs.h"

#include "fetcher.h"
#include "tui.h"

#include "CLI11.hpp"
#include "tbb/task_group.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace gemfetch {

void cmd_specs::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("specs", "List specifications available from registries") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("names",
                  cfg_ptr->names,
                  "Packages to resolve with their dependencies (whole index if omitted)");
  sub->add_option("--source", cfg_ptr->sources, "Registry URI (repeatable)")->required();
  sub->add_flag("--deps", cfg_ptr->show_dependencies, "Print runtime dependencies");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_specs::cmd_specs(cmd_specs::cfg cfg, settings const &s)
    : cfg_{ std::move(cfg) }, settings_{ s } {}

std::vector<spec_index> cmd_specs::fetch_all(cfg const &c,
                                             settings const &s,
                                             transport_factory_t const &make_transport) {
  if (c.sources.empty()) { throw std::invalid_argument("specs: at least one --source"); }

  auto const fetch_cfg{ make_fetch_config(s, "specs") };
  std::optional<std::vector<std::string>> names;
  if (!c.names.empty()) { names = c.names; }

  std::vector<spec_index> results(c.sources.size());
  tbb::task_group tg;
  for (size_t i{}; i < c.sources.size(); ++i) {
    tg.run([&, i]() {
      auto session{ make_fetcher(c.sources[i], s, fetch_cfg, make_transport()) };
      results[i] = session->specs(names, c.sources[i]);
    });
  }
  tg.wait();

  return results;
}

std::vector<std::string> cmd_specs::format(spec_index const &index,
                                           bool show_dependencies) {
  std::vector<std::string> lines;
  for (auto const &name : index.names()) {
    auto variants{ index.search(name) };
    std::ranges::sort(variants, [](package_spec_ptr const &a, package_spec_ptr const &b) {
      if (a->version() != b->version()) { return a->version() < b->version(); }
      return a->platform() < b->platform();
    });

    for (auto const &spec : variants) {
      std::string line{ spec->name() + " (" + spec->version().to_string() };
      if (spec->platform() != kRubyPlatform) { line += "-" + spec->platform(); }
      line += ")";
      lines.push_back(std::move(line));

      if (show_dependencies) {
        for (auto const &dep : spec->dependencies()) {
          lines.push_back("  " + dep.to_string());
        }
      }
    }
  }
  return lines;
}

void cmd_specs::execute() {
  auto const indices{ fetch_all(cfg_, settings_, default_transport_factory()) };

  spec_index merged;
  for (auto const &index : indices) { merged.merge(index); }

  tui::debug("%zu specifications from %zu sources", merged.size(), indices.size());
  for (auto const &line : format(merged, cfg_.show_dependencies)) {
    tui::print_stdout("%s\n", line.c_str());
  }
}

}  // namespace gemfetch
