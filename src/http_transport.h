#pragma once

#include "util.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gemfetch {

// Header names are stored lower-case.
using http_headers = std::map<std::string, std::string>;

struct http_request {
  std::string method{ "GET" };
  std::string url;  // absolute, credentials already removed
  std::optional<std::string> basic_auth_user;
  std::optional<std::string> basic_auth_password;
  http_headers headers;
};

struct http_response {
  int status{ 0 };
  http_headers headers;
  std::string body;
  std::string peer;  // remote address as reported by the transport, may be empty

  std::optional<std::string> header(std::string_view name) const;
};

enum class tls_verify_mode { PEER, NONE };

struct tls_options {
  tls_verify_mode verify{ tls_verify_mode::PEER };
  std::optional<std::filesystem::path> ca_file;
  std::optional<std::filesystem::path> ca_dir;
  std::string extra_ca_pem;  // appended to the system roots when ca_file/ca_dir unset
  std::optional<std::filesystem::path> client_cert;  // PEM holding certificate and key
};

struct connection_options {
  std::chrono::milliseconds read_timeout{ std::chrono::seconds{ 10 } };
  std::string user_agent;
  std::optional<tls_options> tls;  // nullopt: plain http, no TLS configuration
};

// One persistent connection to a single origin. Performs exactly one exchange per call;
// redirects are never followed here. Throws transport_fault when no HTTP response was
// obtained.
class http_connection : unmovable {
 public:
  virtual ~http_connection() = default;
  virtual http_response request(http_request const &req) = 0;
};

class http_transport : unmovable {
 public:
  virtual ~http_transport() = default;

  virtual bool tls_available() const = 0;

  // `origin` is "scheme://host:port".
  virtual std::unique_ptr<http_connection> open(std::string const &origin,
                                                connection_options const &options) = 0;
};

}  // namespace gemfetch
