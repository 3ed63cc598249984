#pragma once

#include "fetch_config.h"
#include "http_transport.h"
#include "uri.h"
#include "util.h"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace gemfetch {

// Owns one persistent connection per origin for a fetch session. TLS configuration is
// resolved once, at construction.
class connection_manager : unmovable {
 public:
  connection_manager(fetch_config const &cfg, std::shared_ptr<http_transport> transport);

  // Same connection object for every URI sharing an origin. Throws fetch_error
  // TLS_UNAVAILABLE when the URI needs TLS and the transport has none.
  http_connection &connect(uri const &target);

  bool requires_tls(uri const &target) const;

  std::optional<tls_options> const &tls() const { return tls_; }
  std::size_t connection_count() const { return connections_.size(); }

 private:
  std::shared_ptr<http_transport> transport_;
  connection_options plain_options_;
  std::optional<tls_options> tls_;
  bool tls_explicitly_requested_{ false };
  std::unordered_map<std::string, std::unique_ptr<http_connection>> connections_;
};

// "peer"/"1" -> PEER, "none"/"0" -> NONE; throws std::invalid_argument otherwise.
tls_verify_mode parse_tls_verify_mode(std::string_view value);

// Concatenation of every *.pem file in `dir` (sorted by name); empty if missing.
std::string load_bundled_certificates(std::filesystem::path const &dir);

}  // namespace gemfetch
