#include "http_transport.h"

namespace gemfetch {

std::optional<std::string> http_response::header(std::string_view name) const {
  auto const it{ headers.find(util_to_lower(name)) };
  if (it == headers.end()) { return std::nullopt; }
  return it->second;
}

}  // namespace gemfetch
