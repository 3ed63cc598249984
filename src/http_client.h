#pragma once

#include "connection_manager.h"
#include "fetch_config.h"
#include "http_transport.h"
#include "uri.h"
#include "util.h"

#include <memory>
#include <mutex>
#include <string>

namespace gemfetch {

// Single-request executor plus bounded redirect following for one fetch session.
// Requests are serialised: at most one is outstanding at a time.
class http_client : unmovable {
 public:
  http_client(fetch_config const &cfg, std::shared_ptr<connection_manager> connections);

  // One GET, no redirect handling. Basic-auth credentials embedded in `target`
  // (percent-decoded) are attached. Transport faults become fetch_error.
  http_response execute(uri const &target);

  // GET following up to redirect_limit responses. Returns the body of the terminal 2xx
  // response; every other outcome throws fetch_error.
  std::string fetch(uri const &target);

  int redirect_limit() const { return redirect_limit_; }

 private:
  http_response execute_unlocked(uri const &target);

  int redirect_limit_;
  std::shared_ptr<connection_manager> connections_;
  std::mutex mutex_;
};

// Location header target, carrying the original credentials only when its host is
// exactly the original host.
uri http_redirect_target(uri const &original, uri const &current, std::string_view location);

}  // namespace gemfetch
