#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace gemfetch {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(http_request),
          TRACE_NAME(http_response),
          TRACE_NAME(http_redirect),
          TRACE_NAME(transport_fault),
          TRACE_NAME(retry_attempt),
          TRACE_NAME(closure_round),
          TRACE_NAME(api_probe),
          TRACE_NAME(api_fallback),
          TRACE_NAME(full_index_start),
          TRACE_NAME(full_index_complete),
          TRACE_NAME(spec_file_fetch),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::http_request const &value) {
            std::ostringstream oss;
            oss << "http_request method=" << value.method << " url=" << value.url;
            return oss.str();
          },
          [](trace_events::http_response const &value) {
            std::ostringstream oss;
            oss << "http_response url=" << value.url << " status=" << value.status
                << " peer=" << value.peer << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::http_redirect const &value) {
            std::ostringstream oss;
            oss << "http_redirect from=" << value.from << " to=" << value.to
                << " depth=" << value.depth
                << " credentials_forwarded=" << bool_string(value.credentials_forwarded);
            return oss.str();
          },
          [](trace_events::transport_fault const &value) {
            std::ostringstream oss;
            oss << "transport_fault url=" << value.url << " kind=" << value.kind
                << " detail=" << value.detail;
            return oss.str();
          },
          [](trace_events::retry_attempt const &value) {
            std::ostringstream oss;
            oss << "retry_attempt operation=" << value.operation
                << " attempt=" << value.attempt << "/" << value.max_attempts
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::closure_round const &value) {
            std::ostringstream oss;
            oss << "closure_round registry=" << value.registry << " round=" << value.round
                << " frontier_size=" << value.frontier_size
                << " batches=" << value.batches << " collected=" << value.collected;
            return oss.str();
          },
          [](trace_events::api_probe const &value) {
            std::ostringstream oss;
            oss << "api_probe registry=" << value.registry
                << " available=" << bool_string(value.available);
            return oss.str();
          },
          [](trace_events::api_fallback const &value) {
            std::ostringstream oss;
            oss << "api_fallback registry=" << value.registry
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::full_index_start const &value) {
            std::ostringstream oss;
            oss << "full_index_start registry=" << value.registry;
            return oss.str();
          },
          [](trace_events::full_index_complete const &value) {
            std::ostringstream oss;
            oss << "full_index_complete registry=" << value.registry
                << " spec_count=" << value.spec_count
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::spec_file_fetch const &value) {
            std::ostringstream oss;
            oss << "spec_file_fetch file=" << value.file_name
                << " origin=" << value.origin;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::http_request const &value) {
            append_kv(output, "method", value.method);
            append_kv(output, "url", value.url);
          },
          [&](trace_events::http_response const &value) {
            append_kv(output, "url", value.url);
            append_kv(output, "status", static_cast<std::int64_t>(value.status));
            append_kv(output, "peer", value.peer);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::http_redirect const &value) {
            append_kv(output, "from", value.from);
            append_kv(output, "to", value.to);
            append_kv(output, "depth", static_cast<std::int64_t>(value.depth));
            append_kv(output, "credentials_forwarded", value.credentials_forwarded);
          },
          [&](trace_events::transport_fault const &value) {
            append_kv(output, "url", value.url);
            append_kv(output, "kind", value.kind);
            append_kv(output, "detail", value.detail);
          },
          [&](trace_events::retry_attempt const &value) {
            append_kv(output, "operation", value.operation);
            append_kv(output, "attempt", static_cast<std::int64_t>(value.attempt));
            append_kv(output, "max_attempts", static_cast<std::int64_t>(value.max_attempts));
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::closure_round const &value) {
            append_kv(output, "registry", value.registry);
            append_kv(output, "round", static_cast<std::int64_t>(value.round));
            append_kv(output, "frontier_size", value.frontier_size);
            append_kv(output, "batches", value.batches);
            append_kv(output, "collected", value.collected);
          },
          [&](trace_events::api_probe const &value) {
            append_kv(output, "registry", value.registry);
            append_kv(output, "available", value.available);
          },
          [&](trace_events::api_fallback const &value) {
            append_kv(output, "registry", value.registry);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::full_index_start const &value) {
            append_kv(output, "registry", value.registry);
          },
          [&](trace_events::full_index_complete const &value) {
            append_kv(output, "registry", value.registry);
            append_kv(output, "spec_count", value.spec_count);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::spec_file_fetch const &value) {
            append_kv(output, "file_name", value.file_name);
            append_kv(output, "origin", value.origin);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace gemfetch
