#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gemfetch {

enum class fetch_error_kind {
  NETWORK_DOWN,
  CERTIFICATE_FAILURE,
  TLS_UNAVAILABLE,
  AUTHENTICATION_REQUIRED,
  BAD_AUTHENTICATION,
  FALLBACK_REQUIRED,
  TOO_MANY_REDIRECTS,
  MALFORMED_SPEC,
  HTTP_ERROR
};

std::string_view fetch_error_kind_name(fetch_error_kind kind);

// Authentication failures: retrying or falling back cannot succeed.
bool fetch_error_is_abort_class(fetch_error_kind kind);

// Kinds the retry loop never repeats regardless of its abort list.
bool fetch_error_is_retryable(fetch_error_kind kind);

// Typed failure surfaced to callers. what() is the single user-facing message: it names
// the credential-stripped location and carries a remediation hint.
class fetch_error : public std::runtime_error {
 public:
  fetch_error(fetch_error_kind kind,
              std::string location,
              std::string message,
              std::optional<int> status = std::nullopt);

  fetch_error_kind kind() const { return kind_; }
  std::string const &location() const { return location_; }
  std::optional<int> status() const { return status_; }

 private:
  fetch_error_kind kind_;
  std::string location_;
  std::optional<int> status_;
};

// Canned messages, one per kind that has standard wording.
fetch_error make_network_down_error(std::string const &host);
fetch_error make_certificate_failure_error(std::string const &location);
fetch_error make_tls_unavailable_error(std::string const &location);
fetch_error make_authentication_required_error(std::string const &location);
fetch_error make_bad_authentication_error(std::string const &location);
fetch_error make_too_many_redirects_error(std::string const &location);
fetch_error make_malformed_spec_error(std::string const &location,
                                      std::string const &package,
                                      std::string const &detail);

enum class transport_fault_kind {
  DNS_FAILURE,
  HOST_UNREACHABLE,
  TIMEOUT,
  CONNECTION_RESET,
  PROTOCOL_ERROR,
  TLS_FAILURE,
  OTHER
};

std::string_view transport_fault_kind_name(transport_fault_kind kind);

// Raised by an http_connection when no HTTP response was obtained. The detail text is
// diagnostic only.
class transport_fault : public std::runtime_error {
 public:
  transport_fault(transport_fault_kind kind, std::string detail);

  transport_fault_kind kind() const { return kind_; }

 private:
  transport_fault_kind kind_;
};

// Map a transport fault on `location` (credential-stripped, host extracted by caller)
// to the failure taxonomy.
fetch_error classify_transport_fault(transport_fault const &fault,
                                     std::string const &location,
                                     std::string const &host);

}  // namespace gemfetch
