#pragma once

#include "credentials.h"
#include "gem_marshal.h"
#include "http_client.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

inline constexpr char kMarshalSpecDir[]{ "quick/Marshal.4.8/" };

// "name-version[-platform].gemspec"; the platform is omitted when "ruby" or empty.
std::string spec_file_name(std::string_view name,
                           std::string_view version,
                           std::string_view platform);

// Inflate and decode a ".gemspec.rz" body. Throws fetch_error MALFORMED_SPEC naming
// `file_name` when the data is not a valid specification.
gem_marshal_specification spec_file_decode(std::string_view compressed,
                                           std::string const &location,
                                           std::string const &file_name);

// Legacy per-file specification endpoint.
class spec_file_fetcher : unmovable {
 public:
  spec_file_fetcher(credential_scoped_uri registry,
                    std::vector<std::filesystem::path> cache_dirs,
                    std::shared_ptr<http_client> client);

  // file-scheme registry: read locally; otherwise the first cache directory holding
  // "<file>.rz"; otherwise download.
  gem_marshal_specification fetch_spec(std::string_view name,
                                       std::string_view version,
                                       std::string_view platform);

  uri spec_uri(std::string const &file_name) const;

  // First cache directory containing `file_name`, if any.
  std::optional<std::filesystem::path> cached_path(std::string const &file_name) const;

 private:
  credential_scoped_uri registry_;
  std::vector<std::filesystem::path> cache_dirs_;
  std::shared_ptr<http_client> client_;
};

}  // namespace gemfetch
