#include "platform.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" char **environ;

namespace gemfetch::platform {

namespace {

std::atomic_bool s_reverse_dns_disabled{ false };

}  // namespace

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

std::string_view os_name() {
#if defined(__APPLE__) && defined(__MACH__)
  return "darwin";
#elif defined(__linux__)
  return "linux";
#else
#error "unsupported POSIX OS"
#endif
}

std::string_view arch_name() {
#if defined(__aarch64__) || defined(__arm64__)
  return
#if defined(__APPLE__)
      "arm64";
#else
      "aarch64";
#endif
#elif defined(__x86_64__)
  return "x86_64";
#else
#error "unsupported architecture"
#endif
}

std::vector<std::string> get_environment() {
  std::vector<std::string> result;
  for (char **ep = environ; *ep; ++ep) { result.emplace_back(*ep); }
  return result;
}

void env_var_set(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("env_var_set: null name or value");
  }

  if (::setenv(name, value, 1) != 0) {
    throw std::runtime_error(std::string("env_var_set: failed to set ") + name);
  }
}

void env_var_unset(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_unset: null name"); }
  ::unsetenv(name);
}

void disable_reverse_dns_lookup() { s_reverse_dns_disabled = true; }

bool reverse_dns_lookup_disabled() { return s_reverse_dns_disabled.load(); }

std::string peer_display_name(std::string const &numeric_address) {
  if (numeric_address.empty() || reverse_dns_lookup_disabled()) { return numeric_address; }

  sockaddr_storage storage{};
  socklen_t length{ 0 };

  auto *v4{ reinterpret_cast<sockaddr_in *>(&storage) };
  auto *v6{ reinterpret_cast<sockaddr_in6 *>(&storage) };
  if (::inet_pton(AF_INET, numeric_address.c_str(), &v4->sin_addr) == 1) {
    v4->sin_family = AF_INET;
    length = sizeof(sockaddr_in);
  } else if (::inet_pton(AF_INET6, numeric_address.c_str(), &v6->sin6_addr) == 1) {
    v6->sin6_family = AF_INET6;
    length = sizeof(sockaddr_in6);
  } else {
    return numeric_address;
  }

  char host[NI_MAXHOST]{};
  if (::getnameinfo(reinterpret_cast<sockaddr *>(&storage),
                    length,
                    host,
                    sizeof host,
                    nullptr,
                    0,
                    NI_NAMEREQD) != 0) {
    return numeric_address;
  }
  return host;
}

}  // namespace gemfetch::platform
