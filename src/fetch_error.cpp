#include "fetch_error.h"

#include <cctype>
#include <utility>

namespace gemfetch {

std::string_view fetch_error_kind_name(fetch_error_kind kind) {
  switch (kind) {
    case fetch_error_kind::NETWORK_DOWN: return "network_down";
    case fetch_error_kind::CERTIFICATE_FAILURE: return "certificate_failure";
    case fetch_error_kind::TLS_UNAVAILABLE: return "tls_unavailable";
    case fetch_error_kind::AUTHENTICATION_REQUIRED: return "authentication_required";
    case fetch_error_kind::BAD_AUTHENTICATION: return "bad_authentication";
    case fetch_error_kind::FALLBACK_REQUIRED: return "fallback_required";
    case fetch_error_kind::TOO_MANY_REDIRECTS: return "too_many_redirects";
    case fetch_error_kind::MALFORMED_SPEC: return "malformed_spec";
    case fetch_error_kind::HTTP_ERROR: return "http_error";
  }
  return "unknown";
}

bool fetch_error_is_abort_class(fetch_error_kind kind) {
  return kind == fetch_error_kind::AUTHENTICATION_REQUIRED ||
         kind == fetch_error_kind::BAD_AUTHENTICATION;
}

bool fetch_error_is_retryable(fetch_error_kind kind) {
  return kind != fetch_error_kind::CERTIFICATE_FAILURE &&
         kind != fetch_error_kind::TLS_UNAVAILABLE;
}

fetch_error::fetch_error(fetch_error_kind kind,
                         std::string location,
                         std::string message,
                         std::optional<int> status)
    : std::runtime_error{ std::move(message) },
      kind_{ kind },
      location_{ std::move(location) },
      status_{ status } {}

fetch_error make_network_down_error(std::string const &host) {
  return fetch_error{ fetch_error_kind::NETWORK_DOWN,
                      host,
                      "Could not reach host " + host +
                          ". Check your network connection and try again." };
}

fetch_error make_certificate_failure_error(std::string const &location) {
  return fetch_error{
    fetch_error_kind::CERTIFICATE_FAILURE,
    location,
    "Could not verify the SSL certificate for " + location +
        ".\nThere is a chance you are experiencing a man-in-the-middle attack, but most "
        "likely your system doesn't have the CA certificates needed for verification. "
        "Point ssl_ca_cert at a CA bundle, or to connect without SSL change the source "
        "from 'https' to 'http'."
  };
}

fetch_error make_tls_unavailable_error(std::string const &location) {
  return fetch_error{ fetch_error_kind::TLS_UNAVAILABLE,
                      location,
                      "Could not load TLS support needed for " + location +
                          ".\nInstall a libcurl built with TLS support or change the "
                          "source from 'https' to 'http'." };
}

fetch_error make_authentication_required_error(std::string const &location) {
  std::string env_name{ "GEMFETCH_" };
  for (char const c : location) {
    if (c == '.') {
      env_name += "__";
    } else {
      env_name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
  }

  return fetch_error{ fetch_error_kind::AUTHENTICATION_REQUIRED,
                      location,
                      "Authentication is required for " + location +
                          ".\nPlease supply credentials for this source. You can do "
                          "this by running:\n  export " +
                          env_name + "=username:password\nor by adding a '" + location +
                          ": username:password' line to your config file." };
}

fetch_error make_bad_authentication_error(std::string const &location) {
  return fetch_error{ fetch_error_kind::BAD_AUTHENTICATION,
                      location,
                      "Bad username or password for " + location +
                          ".\nPlease double-check your credentials and correct them." };
}

fetch_error make_too_many_redirects_error(std::string const &location) {
  return fetch_error{ fetch_error_kind::TOO_MANY_REDIRECTS,
                      location,
                      "Too many redirects while fetching " + location };
}

fetch_error make_malformed_spec_error(std::string const &location,
                                      std::string const &package,
                                      std::string const &detail) {
  return fetch_error{ fetch_error_kind::MALFORMED_SPEC,
                      location,
                      "The gem " + package + " from " + location +
                          " has an invalid gemspec (" + detail +
                          ").\nPlease ask the gem author to yank the bad version to fix "
                          "this issue." };
}

std::string_view transport_fault_kind_name(transport_fault_kind kind) {
  switch (kind) {
    case transport_fault_kind::DNS_FAILURE: return "dns_failure";
    case transport_fault_kind::HOST_UNREACHABLE: return "host_unreachable";
    case transport_fault_kind::TIMEOUT: return "timeout";
    case transport_fault_kind::CONNECTION_RESET: return "connection_reset";
    case transport_fault_kind::PROTOCOL_ERROR: return "protocol_error";
    case transport_fault_kind::TLS_FAILURE: return "tls_failure";
    case transport_fault_kind::OTHER: return "other";
  }
  return "unknown";
}

transport_fault::transport_fault(transport_fault_kind kind, std::string detail)
    : std::runtime_error{ std::move(detail) }, kind_{ kind } {}

fetch_error classify_transport_fault(transport_fault const &fault,
                                     std::string const &location,
                                     std::string const &host) {
  switch (fault.kind()) {
    case transport_fault_kind::TLS_FAILURE: return make_certificate_failure_error(location);
    case transport_fault_kind::DNS_FAILURE:
    case transport_fault_kind::HOST_UNREACHABLE: return make_network_down_error(host);
    case transport_fault_kind::TIMEOUT:
    case transport_fault_kind::CONNECTION_RESET:
    case transport_fault_kind::PROTOCOL_ERROR:
    case transport_fault_kind::OTHER: break;
  }
  return fetch_error{ fetch_error_kind::HTTP_ERROR,
                      location,
                      "Network error while fetching " + location };
}

}  // namespace gemfetch
