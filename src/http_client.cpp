#include "http_client.h"

#include "fetch_error.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace gemfetch {

namespace {

constexpr std::size_t kBodySnippetLength{ 200 };

std::string body_snippet(std::string const &body) {
  if (body.size() <= kBodySnippetLength) { return body; }
  return body.substr(0, kBodySnippetLength) + "...";
}

}  // namespace

uri http_redirect_target(uri const &original, uri const &current, std::string_view location) {
  auto target{ uri_without_credentials(uri_resolve_reference(current, location)) };
  if (target.host == original.host && original.has_credentials()) {
    return uri_with_credentials(target, original.user, original.password);
  }
  return target;
}

http_client::http_client(fetch_config const &cfg,
                         std::shared_ptr<connection_manager> connections)
    : redirect_limit_{ cfg.redirect_limit }, connections_{ std::move(connections) } {
  if (!connections_) { throw std::invalid_argument("http_client: null connection manager"); }
}

http_response http_client::execute(uri const &target) {
  std::lock_guard lock{ mutex_ };
  return execute_unlocked(target);
}

http_response http_client::execute_unlocked(uri const &target) {
  auto const safe{ uri_without_credentials(target).to_string() };

  http_request req{};
  req.url = safe;
  if (target.has_credentials()) {
    req.basic_auth_user = uri_percent_decode(target.user);
    req.basic_auth_password = target.password ? uri_percent_decode(*target.password) : "";
  }

  auto &connection{ connections_->connect(target) };

  GEMFETCH_TRACE_HTTP_REQUEST(safe, req.method);
  auto const start{ std::chrono::steady_clock::now() };

  http_response response;
  try {
    response = connection.request(req);
  } catch (transport_fault const &fault) {
    GEMFETCH_TRACE_TRANSPORT_FAULT(safe,
                                   std::string{ transport_fault_kind_name(fault.kind()) },
                                   std::string{ fault.what() });
    tui::debug("HTTP %s %s failed: %s", req.method.c_str(), safe.c_str(), fault.what());
    throw classify_transport_fault(fault, safe, target.host);
  }

  auto const elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start) };
  GEMFETCH_TRACE_HTTP_RESPONSE(safe,
                               response.status,
                               response.peer,
                               static_cast<std::int64_t>(elapsed.count()));
  tui::debug("HTTP %d %s", response.status, safe.c_str());

  return response;
}

std::string http_client::fetch(uri const &target) {
  std::lock_guard lock{ mutex_ };

  uri current{ target };
  for (int depth{ 0 };; ++depth) {
    auto const safe{ uri_without_credentials(current).to_string() };
    if (depth >= redirect_limit_) { throw make_too_many_redirects_error(safe); }

    auto response{ execute_unlocked(current) };
    int const status{ response.status };

    if (status >= 300 && status < 400) {
      auto const location{ response.header("location") };
      if (!location || location->empty()) {
        throw fetch_error{ fetch_error_kind::HTTP_ERROR,
                           safe,
                           "Redirect without a Location header from " + safe,
                           status };
      }

      uri next;
      try {
        next = http_redirect_target(target, current, *location);
      } catch (std::invalid_argument const &ex) {
        throw fetch_error{ fetch_error_kind::HTTP_ERROR,
                           safe,
                           "Invalid redirect location from " + safe + ": " + ex.what(),
                           status };
      }

      GEMFETCH_TRACE_HTTP_REDIRECT(safe,
                                   uri_without_credentials(next).to_string(),
                                   depth + 1,
                                   next.has_credentials());
      current = std::move(next);
      continue;
    }

    if (status >= 200 && status < 300) { return std::move(response.body); }

    if (status == 413) {
      tui::debug("Request to %s too large, full index required: %s",
                 safe.c_str(),
                 body_snippet(response.body).c_str());
      throw fetch_error{ fetch_error_kind::FALLBACK_REQUIRED,
                         safe,
                         std::move(response.body),
                         status };
    }

    if (status == 401) { throw make_authentication_required_error(current.host); }

    std::string message{ "HTTP " + std::to_string(status) + " from " + safe };
    if (!response.body.empty()) { message += ": " + body_snippet(response.body); }
    throw fetch_error{ fetch_error_kind::HTTP_ERROR, safe, std::move(message), status };
  }
}

}  // namespace gemfetch
