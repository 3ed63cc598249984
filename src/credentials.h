#pragma once

#include "settings.h"
#include "uri.h"

#include <optional>
#include <string>
#include <string_view>

namespace gemfetch {

// A registry location paired with its basic-auth credentials. Only the
// credential-stripped form is ever displayed or logged.
class credential_scoped_uri {
 public:
  credential_scoped_uri() = default;

  // `configured_auth` ("user:password" or "user") replaces credentials embedded in
  // `location`; without it the embedded credentials are kept.
  explicit credential_scoped_uri(uri location,
                                 std::optional<std::string> configured_auth = std::nullopt);

  uri const &original() const { return original_; }
  uri const &without_credentials() const { return safe_; }
  bool has_credentials() const { return original_.has_credentials(); }

  // Display form, never carries credentials.
  std::string to_string() const { return safe_.to_string(); }

  bool operator==(credential_scoped_uri const &other) const = default;

 private:
  uri original_;
  uri safe_;
};

// Registry base with a trailing '/', so relative endpoint paths join under it.
uri credentials_normalize_source(std::string_view source);

// Settings "mirror.<source uri>" (with or without trailing slash), then "mirror.all".
uri credentials_mirror_for(uri const &source, settings const &s);

// Settings keyed by the full source URI, then by its host.
std::optional<std::string> credentials_lookup(uri const &source, settings const &s);

// Mirror substitution followed by credential lookup.
credential_scoped_uri credentials_resolve(std::string_view source, settings const &s);

}  // namespace gemfetch
