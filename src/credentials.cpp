#include "credentials.h"

#include "tui.h"

#include <utility>

namespace gemfetch {

namespace {

std::string without_trailing_slash(std::string value) {
  while (value.size() > 1 && value.back() == '/') { value.pop_back(); }
  return value;
}

}  // namespace

credential_scoped_uri::credential_scoped_uri(uri location,
                                             std::optional<std::string> configured_auth)
    : original_{ std::move(location) } {
  if (configured_auth && !configured_auth->empty()) {
    auto const colon{ configured_auth->find(':') };
    if (colon == std::string::npos) {
      original_ = uri_with_credentials(original_, *configured_auth, std::nullopt);
    } else {
      original_ = uri_with_credentials(original_,
                                       configured_auth->substr(0, colon),
                                       configured_auth->substr(colon + 1));
    }
  }
  safe_ = uri_without_credentials(original_);
}

uri credentials_normalize_source(std::string_view source) {
  return uri_as_directory(uri_parse(source));
}

uri credentials_mirror_for(uri const &source, settings const &s) {
  auto const key{ uri_without_credentials(source).to_string() };

  for (auto const &candidate : { "mirror." + key, "mirror." + without_trailing_slash(key) }) {
    if (auto const mirror{ s.get(candidate) }) {
      auto result{ credentials_normalize_source(*mirror) };
      tui::debug("Using mirror %s for %s",
                 uri_without_credentials(result).to_string().c_str(),
                 key.c_str());
      return result;
    }
  }

  if (auto const mirror{ s.get("mirror.all") }) { return credentials_normalize_source(*mirror); }

  return source;
}

std::optional<std::string> credentials_lookup(uri const &source, settings const &s) {
  auto const key{ uri_without_credentials(source).to_string() };
  if (auto value{ s.get(key) }) { return value; }
  if (auto value{ s.get(without_trailing_slash(key)) }) { return value; }
  return s.get(source.host);
}

credential_scoped_uri credentials_resolve(std::string_view source, settings const &s) {
  auto const mirrored{ credentials_mirror_for(credentials_normalize_source(source), s) };
  return credential_scoped_uri{ mirrored, credentials_lookup(mirrored, s) };
}

}  // namespace gemfetch
