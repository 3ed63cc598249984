#pragma once

#include "fetch_error.h"
#include "trace.h"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

struct retry_policy {
  int max_attempts{ 3 };
  std::chrono::milliseconds delay{ 0 };  // linear: delay * attempt number
  std::vector<fetch_error_kind> abort_on{ fetch_error_kind::AUTHENTICATION_REQUIRED,
                                          fetch_error_kind::BAD_AUTHENTICATION };
};

// True when `kind` must be re-raised without another attempt.
bool retry_should_abort(retry_policy const &policy, fetch_error_kind kind);

// Sleep before attempt `next_attempt` (2, 3, ...).
void retry_pause(retry_policy const &policy, int next_attempt);

// Run `operation` until it returns, retrying fetch_errors up to max_attempts total.
// Aborting kinds and non-fetch_error exceptions propagate immediately; the last failure
// propagates once attempts are exhausted.
template <typename Fn>
auto retry_attempt(retry_policy const &policy, std::string_view name, Fn &&operation)
    -> decltype(operation()) {
  int const max_attempts{ policy.max_attempts < 1 ? 1 : policy.max_attempts };

  for (int attempt{ 1 };; ++attempt) {
    try {
      return operation();
    } catch (fetch_error const &err) {
      if (retry_should_abort(policy, err.kind()) || attempt >= max_attempts) { throw; }

      GEMFETCH_TRACE_RETRY_ATTEMPT(std::string{ name },
                                   attempt + 1,
                                   max_attempts,
                                   std::string{ fetch_error_kind_name(err.kind()) });
      retry_pause(policy, attempt + 1);
    }
  }
}

}  // namespace gemfetch
