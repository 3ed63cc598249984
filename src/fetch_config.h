#pragma once

#include "settings.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gemfetch {

// Per-session configuration, passed by value into every fetch session.
struct fetch_config {
  int redirect_limit{ 5 };
  std::chrono::milliseconds read_timeout{ std::chrono::seconds{ 10 } };
  int max_attempts{ 3 };
  std::chrono::milliseconds retry_delay{ 250 };  // multiplied by the attempt number
  std::size_t api_request_limit{ 100 };
  bool disable_endpoint{ false };
  std::string self_name{ "bundler" };
  std::string user_agent;
  std::vector<std::filesystem::path> spec_cache_dirs;

  // TLS
  std::optional<std::string> ssl_verify_mode;
  std::optional<std::filesystem::path> ssl_ca_cert;
  std::optional<std::filesystem::path> ssl_client_cert;
  std::optional<std::filesystem::path> bundled_certs_dir;
};

// Throws std::invalid_argument on out-of-range or non-numeric values.
fetch_config fetch_config_from_settings(settings const &s, std::string user_agent);

}  // namespace gemfetch
