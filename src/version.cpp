#include "version.h"

#ifndef GEMFETCH_VERSION_STR
#error "GEMFETCH_VERSION_STR must be defined by the build system"
#endif

namespace gemfetch {

std::string_view gemfetch_version() { return GEMFETCH_VERSION_STR; }

}  // namespace gemfetch
