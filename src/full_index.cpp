#include "full_index.h"

#include "fetch_error.h"
#include "gem_marshal.h"
#include "marshal.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>

namespace gemfetch {

namespace {

std::string load_artifact(uri const &target, http_client &client) {
  if (target.kind() == uri_scheme::LOCAL_FILE) {
    auto const bytes{ util_load_file(target.path) };
    return std::string{ bytes.begin(), bytes.end() };
  }
  return client.fetch(target);
}

// nullopt when the artifact is optional and absent.
std::optional<std::string> fetch_artifact(credential_scoped_uri const &registry,
                                          char const *file_name,
                                          bool may_be_absent,
                                          http_client &client) {
  auto const target{ uri_join_path(registry.original(), file_name) };
  auto const safe{ registry.to_string() };

  if (target.kind() == uri_scheme::LOCAL_FILE && may_be_absent) {
    std::error_code ec;
    if (!std::filesystem::exists(target.path, ec)) {
      tui::debug("No %s at %s", file_name, safe.c_str());
      return std::nullopt;
    }
  }

  try {
    return load_artifact(target, client);
  } catch (fetch_error const &err) {
    switch (err.kind()) {
      case fetch_error_kind::CERTIFICATE_FAILURE:
      case fetch_error_kind::TLS_UNAVAILABLE:
      case fetch_error_kind::BAD_AUTHENTICATION: throw;
      case fetch_error_kind::AUTHENTICATION_REQUIRED:
        throw make_authentication_required_error(safe);
      default: break;
    }

    if (err.status() == 403) {
      if (registry.has_credentials()) { throw make_bad_authentication_error(safe); }
      throw make_authentication_required_error(safe);
    }
    if (may_be_absent && err.status() == 404) {
      tui::debug("No %s at %s", file_name, safe.c_str());
      return std::nullopt;
    }

    tui::debug("Full index fetch failed: %s", err.what());
    throw fetch_error{ fetch_error_kind::HTTP_ERROR,
                       safe,
                       "Could not fetch specs from " + safe,
                       err.status() };
  } catch (std::runtime_error const &ex) {
    tui::debug("Full index read failed: %s", ex.what());
    throw fetch_error{ fetch_error_kind::HTTP_ERROR, safe, "Could not fetch specs from " + safe };
  }
}

}  // namespace

std::vector<raw_spec> full_index_decode(std::string_view compressed) {
  auto const inflated{ util_inflate(compressed, true) };
  auto const doc{ marshal_document::parse(inflated) };

  std::vector<raw_spec> result;
  auto const &tuples{ doc.root().as_array() };
  result.reserve(tuples.size());

  for (auto const *tuple : tuples) {
    auto const &fields{ tuple->as_array() };
    if (fields.size() < 3) { throw marshal_error("marshal: short index tuple"); }
    result.push_back(raw_spec{ .name = fields[0]->as_string(),
                               .version = gem_marshal_version(*fields[1]),
                               .platform = gem_marshal_platform(*fields[2]),
                               .dependencies = std::nullopt });
  }
  return result;
}

std::vector<raw_spec> full_index_fetch(credential_scoped_uri const &registry,
                                       http_client &client) {
  auto const safe{ registry.to_string() };
  auto const start{ std::chrono::steady_clock::now() };
  GEMFETCH_TRACE_FULL_INDEX_START(safe);

  std::vector<raw_spec> result;
  for (auto const &[file_name, may_be_absent] :
       { std::pair{ kFullIndexFile, false }, std::pair{ kPrereleaseIndexFile, true } }) {
    auto const body{ fetch_artifact(registry, file_name, may_be_absent, client) };
    if (!body) { continue; }

    try {
      auto entries{ full_index_decode(*body) };
      result.insert(result.end(),
                    std::make_move_iterator(entries.begin()),
                    std::make_move_iterator(entries.end()));
    } catch (std::exception const &ex) {
      tui::debug("Invalid %s from %s: %s", file_name, safe.c_str(), ex.what());
      throw fetch_error{ fetch_error_kind::HTTP_ERROR,
                         safe,
                         "Could not fetch specs from " + safe };
    }
  }

  auto const elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start) };
  GEMFETCH_TRACE_FULL_INDEX_COMPLETE(safe,
                                     static_cast<std::int64_t>(result.size()),
                                     static_cast<std::int64_t>(elapsed.count()));
  return result;
}

}  // namespace gemfetch
