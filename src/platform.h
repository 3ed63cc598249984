#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gemfetch::platform {

bool is_tty();

std::string_view os_name();
std::string_view arch_name();

// "NAME=value" entries of the process environment.
std::vector<std::string> get_environment();

void env_var_set(char const *name, char const *value);
void env_var_unset(char const *name);

// Process-wide switch. Once disabled, peer addresses are reported numerically and no
// PTR lookups are issued for diagnostics.
void disable_reverse_dns_lookup();
bool reverse_dns_lookup_disabled();

// Display form of a connected peer address ("93.184.216.34" or its PTR name).
std::string peer_display_name(std::string const &numeric_address);

}  // namespace gemfetch::platform
