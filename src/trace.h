#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace gemfetch {

namespace trace_events {

struct http_request {
  std::string url;  // credential-stripped
  std::string method;
};

struct http_response {
  std::string url;
  int status;
  std::string peer;
  std::int64_t duration_ms;
};

struct http_redirect {
  std::string from;
  std::string to;
  int depth;
  bool credentials_forwarded;
};

struct transport_fault {
  std::string url;
  std::string kind;
  std::string detail;  // raw transport text, never shown to the user directly
};

struct retry_attempt {
  std::string operation;
  int attempt;
  int max_attempts;
  std::string reason;
};

struct closure_round {
  std::string registry;
  int round;
  std::int64_t frontier_size;
  std::int64_t batches;
  std::int64_t collected;
};

struct api_probe {
  std::string registry;
  bool available;
};

struct api_fallback {
  std::string registry;
  std::string reason;
};

struct full_index_start {
  std::string registry;
};

struct full_index_complete {
  std::string registry;
  std::int64_t spec_count;
  std::int64_t duration_ms;
};

struct spec_file_fetch {
  std::string file_name;
  std::string origin;  // "local", "cache" or "remote"
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::http_request,
                                   trace_events::http_response,
                                   trace_events::http_redirect,
                                   trace_events::transport_fault,
                                   trace_events::retry_attempt,
                                   trace_events::closure_round,
                                   trace_events::api_probe,
                                   trace_events::api_fallback,
                                   trace_events::full_index_start,
                                   trace_events::full_index_complete,
                                   trace_events::spec_file_fetch>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace gemfetch

#define GEMFETCH_TRACE_UNLIKELY [[unlikely]]

#define GEMFETCH_TRACE_EMIT(event_expr) \
  do { \
    if (::gemfetch::tui::g_trace_enabled) GEMFETCH_TRACE_UNLIKELY { \
        ::gemfetch::tui::trace event_expr; \
      } \
  } while (0)

#define GEMFETCH_TRACE_HTTP_REQUEST(url_value, method_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::http_request{ \
      .url = (url_value), \
      .method = (method_value), \
  }))

#define GEMFETCH_TRACE_HTTP_RESPONSE(url_value, status_value, peer_value, duration_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::http_response{ \
      .url = (url_value), \
      .status = (status_value), \
      .peer = (peer_value), \
      .duration_ms = (duration_value), \
  }))

#define GEMFETCH_TRACE_HTTP_REDIRECT(from_value, to_value, depth_value, forwarded_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::http_redirect{ \
      .from = (from_value), \
      .to = (to_value), \
      .depth = (depth_value), \
      .credentials_forwarded = (forwarded_value), \
  }))

#define GEMFETCH_TRACE_TRANSPORT_FAULT(url_value, kind_value, detail_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::transport_fault{ \
      .url = (url_value), \
      .kind = (kind_value), \
      .detail = (detail_value), \
  }))

#define GEMFETCH_TRACE_RETRY_ATTEMPT(operation_value, attempt_value, max_value, reason_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::retry_attempt{ \
      .operation = (operation_value), \
      .attempt = (attempt_value), \
      .max_attempts = (max_value), \
      .reason = (reason_value), \
  }))

#define GEMFETCH_TRACE_CLOSURE_ROUND(registry_value, \
                                     round_value, \
                                     frontier_value, \
                                     batches_value, \
                                     collected_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::closure_round{ \
      .registry = (registry_value), \
      .round = (round_value), \
      .frontier_size = (frontier_value), \
      .batches = (batches_value), \
      .collected = (collected_value), \
  }))

#define GEMFETCH_TRACE_API_PROBE(registry_value, available_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::api_probe{ \
      .registry = (registry_value), \
      .available = (available_value), \
  }))

#define GEMFETCH_TRACE_API_FALLBACK(registry_value, reason_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::api_fallback{ \
      .registry = (registry_value), \
      .reason = (reason_value), \
  }))

#define GEMFETCH_TRACE_FULL_INDEX_START(registry_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::full_index_start{ \
      .registry = (registry_value), \
  }))

#define GEMFETCH_TRACE_FULL_INDEX_COMPLETE(registry_value, count_value, duration_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::full_index_complete{ \
      .registry = (registry_value), \
      .spec_count = (count_value), \
      .duration_ms = (duration_value), \
  }))

#define GEMFETCH_TRACE_SPEC_FILE_FETCH(file_value, origin_value) \
  GEMFETCH_TRACE_EMIT((::gemfetch::trace_events::spec_file_fetch{ \
      .file_name = (file_value), \
      .origin = (origin_value), \
  }))
