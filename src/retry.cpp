#include "retry.h"

#include "tui.h"

#include <algorithm>
#include <thread>

namespace gemfetch {

bool retry_should_abort(retry_policy const &policy, fetch_error_kind kind) {
  return !fetch_error_is_retryable(kind) || std::ranges::find(policy.abort_on, kind) !=
                                                policy.abort_on.end();
}

void retry_pause(retry_policy const &policy, int next_attempt) {
  tui::debug("Retrying (attempt %d of %d)", next_attempt, policy.max_attempts);
  if (policy.delay.count() <= 0) { return; }
  std::this_thread::sleep_for(policy.delay * (next_attempt - 1));
}

}  // namespace gemfetch
