#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Convert single hex character to value (0-15). Returns -1 if invalid.
int util_hex_char_to_int(char c);

// N random bytes as lowercase hex (2N characters). Not for cryptographic use.
std::string util_random_hex(size_t byte_count);

// Trim ASCII whitespace from both ends.
std::string_view util_trim(std::string_view value);

// Split on a delimiter, trimming each piece and dropping empty pieces.
// Example: util_split(" a, b,,c ", ',') -> {"a", "b", "c"}
std::vector<std::string> util_split(std::string_view value, char delimiter);

// Join with separator. Example: util_join({"a", "b"}, ", ") -> "a, b"
std::string util_join(std::vector<std::string> const &parts, std::string_view separator);

std::string util_to_lower(std::string_view value);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Inflate a zlib stream (RFC 1950), or a gzip member when `gzip` is set.
// Throws std::runtime_error on corrupt or truncated input.
std::string util_inflate(std::string_view compressed, bool gzip = false);

}  // namespace gemfetch
