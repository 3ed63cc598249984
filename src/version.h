#pragma once

#include <string_view>

namespace gemfetch {

// Tool version baked in by the build (GEMFETCH_VERSION_STR).
std::string_view gemfetch_version();

}  // namespace gemfetch
