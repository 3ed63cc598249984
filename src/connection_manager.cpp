#include "connection_manager.h"

#include "fetch_error.h"
#include "platform.h"
#include "tui.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace gemfetch {

tls_verify_mode parse_tls_verify_mode(std::string_view value) {
  auto const lowered{ util_to_lower(util_trim(value)) };
  if (lowered == "peer" || lowered == "1") { return tls_verify_mode::PEER; }
  if (lowered == "none" || lowered == "0") { return tls_verify_mode::NONE; }
  throw std::invalid_argument("ssl_verify_mode must be 'peer' or 'none', got: " +
                              std::string{ value });
}

std::string load_bundled_certificates(std::filesystem::path const &dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) { return {}; }

  std::vector<std::filesystem::path> files;
  for (auto const &entry : std::filesystem::directory_iterator{ dir, ec }) {
    if (entry.is_regular_file() && entry.path().extension() == ".pem") {
      files.push_back(entry.path());
    }
  }
  std::ranges::sort(files);

  std::string result;
  for (auto const &file : files) {
    auto const bytes{ util_load_file(file) };
    result.append(bytes.begin(), bytes.end());
    if (!result.empty() && result.back() != '\n') { result.push_back('\n'); }
  }
  return result;
}

connection_manager::connection_manager(fetch_config const &cfg,
                                       std::shared_ptr<http_transport> transport)
    : transport_{ std::move(transport) } {
  if (!transport_) { throw std::invalid_argument("connection_manager: null transport"); }

  platform::disable_reverse_dns_lookup();

  plain_options_.read_timeout = cfg.read_timeout;
  plain_options_.user_agent = cfg.user_agent;

  tls_explicitly_requested_ = cfg.ssl_verify_mode.has_value() || cfg.ssl_client_cert;

  tls_options tls{};
  if (cfg.ssl_verify_mode) { tls.verify = parse_tls_verify_mode(*cfg.ssl_verify_mode); }

  if (cfg.ssl_ca_cert) {
    std::error_code ec;
    if (std::filesystem::is_directory(*cfg.ssl_ca_cert, ec)) {
      tls.ca_dir = *cfg.ssl_ca_cert;
    } else {
      tls.ca_file = *cfg.ssl_ca_cert;
    }
  } else if (cfg.bundled_certs_dir) {
    tls.extra_ca_pem = load_bundled_certificates(*cfg.bundled_certs_dir);
  }

  if (cfg.ssl_client_cert) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(*cfg.ssl_client_cert, ec)) {
      throw std::runtime_error("ssl_client_cert not found: " +
                               cfg.ssl_client_cert->string());
    }
    tls.client_cert = *cfg.ssl_client_cert;
  }

  tls_ = std::move(tls);
}

bool connection_manager::requires_tls(uri const &target) const {
  return target.kind() == uri_scheme::HTTPS || tls_explicitly_requested_;
}

http_connection &connection_manager::connect(uri const &target) {
  auto const origin{ target.origin() };
  if (auto const it{ connections_.find(origin) }; it != connections_.end()) {
    return *it->second;
  }

  connection_options options{ plain_options_ };
  if (requires_tls(target)) {
    if (!transport_->tls_available()) { throw make_tls_unavailable_error(origin); }
    options.tls = tls_;
  }

  tui::debug("Opening connection to %s", origin.c_str());
  auto connection{ transport_->open(origin, options) };
  auto &result{ *connection };
  connections_.emplace(origin, std::move(connection));
  return result;
}

}  // namespace gemfetch
