#pragma once

#include "credentials.h"
#include "http_client.h"
#include "package_spec.h"

#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

inline constexpr char kFullIndexFile[]{ "specs.4.8.gz" };
inline constexpr char kPrereleaseIndexFile[]{ "prerelease_specs.4.8.gz" };

// Gunzip and decode one index artifact: an array of [name, Gem::Version, platform].
// Throws marshal_error or std::runtime_error on corrupt data.
std::vector<raw_spec> full_index_decode(std::string_view compressed);

// Download the complete index of `registry`. Entries carry no dependency list. The
// prerelease index is optional: a 404 (or a missing local file) for it is ignored.
//
// Failures: CERTIFICATE_FAILURE passes through; 401 -> AUTHENTICATION_REQUIRED;
// 403 -> BAD_AUTHENTICATION when the registry carries credentials, else
// AUTHENTICATION_REQUIRED; anything else -> HTTP_ERROR "Could not fetch specs from".
std::vector<raw_spec> full_index_fetch(credential_scoped_uri const &registry,
                                       http_client &client);

}  // namespace gemfetch
