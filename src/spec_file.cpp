#include "spec_file.h"

#include "fetch_error.h"
#include "package_spec.h"
#include "trace.h"
#include "tui.h"

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace gemfetch {

namespace {

std::string load_local_spec(std::filesystem::path const &path, std::string const &safe) {
  try {
    auto const bytes{ util_load_file(path) };
    return std::string{ bytes.begin(), bytes.end() };
  } catch (std::runtime_error const &ex) {
    tui::debug("Reading %s failed: %s", path.string().c_str(), ex.what());
    throw fetch_error{ fetch_error_kind::HTTP_ERROR, safe, "Could not read " + safe };
  }
}

}  // namespace

std::string spec_file_name(std::string_view name,
                           std::string_view version,
                           std::string_view platform) {
  std::string result{ name };
  result += "-";
  result.append(version);
  if (!platform.empty() && platform != kRubyPlatform) {
    result += "-";
    result.append(platform);
  }
  result += ".gemspec";
  return result;
}

gem_marshal_specification spec_file_decode(std::string_view compressed,
                                           std::string const &location,
                                           std::string const &file_name) {
  try {
    auto const inflated{ util_inflate(compressed) };
    auto const doc{ marshal_document::parse(inflated) };
    return gem_marshal_spec(doc.root());
  } catch (std::runtime_error const &ex) {
    tui::debug("Invalid gemspec %s: %s", file_name.c_str(), ex.what());
    throw fetch_error{ fetch_error_kind::MALFORMED_SPEC,
                       location,
                       "Gemspec " + file_name + " contained invalid data.\n" +
                           "Your network or your gem server is probably having issues "
                           "right now." };
  } catch (std::invalid_argument const &ex) {
    tui::debug("Invalid gemspec %s: %s", file_name.c_str(), ex.what());
    throw make_malformed_spec_error(location, file_name, ex.what());
  }
}

spec_file_fetcher::spec_file_fetcher(credential_scoped_uri registry,
                                     std::vector<std::filesystem::path> cache_dirs,
                                     std::shared_ptr<http_client> client)
    : registry_{ std::move(registry) },
      cache_dirs_{ std::move(cache_dirs) },
      client_{ std::move(client) } {}

uri spec_file_fetcher::spec_uri(std::string const &file_name) const {
  return uri_join_path(registry_.original(), std::string{ kMarshalSpecDir } + file_name + ".rz");
}

std::optional<std::filesystem::path> spec_file_fetcher::cached_path(
    std::string const &file_name) const {
  for (auto const &dir : cache_dirs_) {
    auto const candidate{ dir / file_name };
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) { return candidate; }
  }
  return std::nullopt;
}

gem_marshal_specification spec_file_fetcher::fetch_spec(std::string_view name,
                                                        std::string_view version,
                                                        std::string_view platform) {
  auto const file_name{ spec_file_name(name, version, platform) };
  auto const target{ spec_uri(file_name) };
  auto const safe{ uri_without_credentials(target).to_string() };

  std::string compressed;
  if (target.kind() == uri_scheme::LOCAL_FILE) {
    GEMFETCH_TRACE_SPEC_FILE_FETCH(file_name, "local");
    compressed = load_local_spec(target.path, safe);
  } else if (auto const cached{ cached_path(file_name + ".rz") }) {
    GEMFETCH_TRACE_SPEC_FILE_FETCH(file_name, "cache");
    tui::debug("Using cached gemspec %s", cached->string().c_str());
    compressed = load_local_spec(*cached, safe);
  } else {
    GEMFETCH_TRACE_SPEC_FILE_FETCH(file_name, "remote");
    if (!client_) { throw std::runtime_error("spec_file_fetcher: no http client"); }
    compressed = client_->fetch(target);
  }

  return spec_file_decode(compressed, safe, file_name);
}

}  // namespace gemfetch
