#include "fetch_config.h"

#include "util.h"

#include <stdexcept>
#include <utility>

namespace gemfetch {

namespace {

long require_at_least(settings const &s, char const *key, long fallback, long minimum) {
  auto const value{ s.get_int(key).value_or(fallback) };
  if (value < minimum) {
    throw std::invalid_argument(std::string{ "settings: " } + key + " must be at least " +
                                std::to_string(minimum));
  }
  return value;
}

std::optional<std::filesystem::path> optional_path(settings const &s, char const *key) {
  auto value{ s.get(key) };
  if (!value || value->empty()) { return std::nullopt; }
  return std::filesystem::path{ *value };
}

}  // namespace

fetch_config fetch_config_from_settings(settings const &s, std::string user_agent) {
  fetch_config cfg{};

  cfg.redirect_limit =
      static_cast<int>(require_at_least(s, "redirect_limit", cfg.redirect_limit, 0));
  cfg.read_timeout = std::chrono::seconds{ require_at_least(
      s,
      "api_timeout",
      std::chrono::duration_cast<std::chrono::seconds>(cfg.read_timeout).count(),
      1) };

  // max_retries counts additional attempts after the first one
  cfg.max_attempts =
      static_cast<int>(require_at_least(s, "max_retries", cfg.max_attempts - 1, 0)) + 1;
  cfg.retry_delay = std::chrono::milliseconds{
    require_at_least(s, "retry_delay_ms", cfg.retry_delay.count(), 0)
  };
  cfg.api_request_limit = static_cast<std::size_t>(require_at_least(
      s, "api_request_limit", static_cast<long>(cfg.api_request_limit), 1));
  cfg.disable_endpoint = s.get_bool("disable_endpoint", false);
  cfg.user_agent = std::move(user_agent);

  if (auto const dirs{ s.get("spec_cache_dirs") }) {
    for (auto const &dir : util_split(*dirs, ':')) { cfg.spec_cache_dirs.emplace_back(dir); }
  }

  if (auto mode{ s.get("ssl_verify_mode") }; mode && !mode->empty()) {
    cfg.ssl_verify_mode = std::move(*mode);
  }
  cfg.ssl_ca_cert = optional_path(s, "ssl_ca_cert");
  cfg.ssl_client_cert = optional_path(s, "ssl_client_cert");
  cfg.bundled_certs_dir = optional_path(s, "bundled_certs_dir");

  return cfg;
}

}  // namespace gemfetch
