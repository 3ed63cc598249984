#include "cmd_version.h"

#include "libcurl_util.h"
#include "platform.h"
#include "tui.h"
#include "version.h"

#include "CLI11.hpp"
#include "curl/curl.h"
#include "tbb/version.h"
#include "zlib.h"

#include <string>
#include <utility>
#include <vector>

namespace gemfetch {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, settings const & /*s*/)
    : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("gemfetch version %.*s (%.*s-%.*s)",
            static_cast<int>(gemfetch_version().size()),
            gemfetch_version().data(),
            static_cast<int>(platform::os_name().size()),
            platform::os_name().data(),
            static_cast<int>(platform::arch_name().size()),
            platform::arch_name().data());
  tui::info("");
  tui::info("Third-party component versions:");

  libcurl_ensure_initialized();
  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  std::vector<std::string> curl_features;
  if (curl_info->features & CURL_VERSION_SSL) {
    curl_features.push_back(curl_info->ssl_version ? curl_info->ssl_version : "ssl");
  }
  if (curl_info->features & CURL_VERSION_LIBZ) { curl_features.push_back("zlib"); }
  if (!curl_features.empty()) {
    std::string features;
    for (size_t i{ 0 }; i < curl_features.size(); ++i) {
      if (i > 0) features.append(", ");
      features.append(curl_features[i]);
    }
    tui::info("  libcurl: %s (%s)", curl_info->version, features.c_str());
  } else {
    tui::info("  libcurl: %s", curl_info->version);
  }

  tui::info("  zlib: %s", zlibVersion());
  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace gemfetch
