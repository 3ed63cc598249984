#include "fetch_config.h"

#include "doctest.h"

#include <stdexcept>

namespace gemfetch {

TEST_CASE("fetch_config_from_settings defaults") {
  auto const cfg{ fetch_config_from_settings(settings{}, "agent") };
  CHECK(cfg.redirect_limit == 5);
  CHECK(cfg.read_timeout == std::chrono::seconds{ 10 });
  CHECK(cfg.max_attempts == 3);
  CHECK(cfg.api_request_limit == 100);
  CHECK_FALSE(cfg.disable_endpoint);
  CHECK(cfg.self_name == "bundler");
  CHECK(cfg.user_agent == "agent");
  CHECK(cfg.spec_cache_dirs.empty());
  CHECK_FALSE(cfg.ssl_verify_mode.has_value());
}

TEST_CASE("fetch_config_from_settings reads overrides") {
  settings const s{ { { "redirect_limit", "2" },
                      { "api_timeout", "30" },
                      { "max_retries", "0" },
                      { "retry_delay_ms", "0" },
                      { "api_request_limit", "10" },
                      { "disable_endpoint", "true" },
                      { "spec_cache_dirs", "/a:/b" },
                      { "ssl_verify_mode", "none" },
                      { "ssl_ca_cert", "/etc/ca.pem" } } };
  auto const cfg{ fetch_config_from_settings(s, {}) };

  CHECK(cfg.redirect_limit == 2);
  CHECK(cfg.read_timeout == std::chrono::seconds{ 30 });
  CHECK(cfg.max_attempts == 1);
  CHECK(cfg.retry_delay == std::chrono::milliseconds{ 0 });
  CHECK(cfg.api_request_limit == 10);
  CHECK(cfg.disable_endpoint);
  REQUIRE(cfg.spec_cache_dirs.size() == 2);
  CHECK(cfg.spec_cache_dirs[1] == "/b");
  CHECK(cfg.ssl_verify_mode == std::optional<std::string>{ "none" });
  CHECK(cfg.ssl_ca_cert == std::optional<std::filesystem::path>{ "/etc/ca.pem" });
}

TEST_CASE("fetch_config_from_settings rejects out of range values") {
  CHECK_THROWS_AS(fetch_config_from_settings(settings{ { { "api_request_limit", "0" } } }, {}),
                  std::invalid_argument);
  CHECK_THROWS_AS(fetch_config_from_settings(settings{ { { "redirect_limit", "-1" } } }, {}),
                  std::invalid_argument);
  CHECK_THROWS_AS(fetch_config_from_settings(settings{ { { "api_timeout", "abc" } } }, {}),
                  std::invalid_argument);
}

}  // namespace gemfetch
