#include "util.h"

#include "zlib.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <string>

namespace gemfetch {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

int util_hex_char_to_int(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
  if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
  return -1;
}

std::string util_random_hex(size_t byte_count) {
  std::random_device rd;
  std::uniform_int_distribution<int> dist{ 0, 255 };

  std::vector<unsigned char> bytes(byte_count);
  for (auto &b : bytes) { b = static_cast<unsigned char>(dist(rd)); }
  return util_bytes_to_hex(bytes.data(), bytes.size());
}

std::string_view util_trim(std::string_view value) {
  auto const first{ value.find_first_not_of(" \t\n\r\f\v") };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(" \t\n\r\f\v") };
  return value.substr(first, last - first + 1);
}

std::vector<std::string> util_split(std::string_view value, char delimiter) {
  std::vector<std::string> result;
  for (std::string_view sv{ value }; !sv.empty();) {
    auto const pos{ sv.find(delimiter) };
    auto const token{ util_trim(sv.substr(0, pos)) };
    if (!token.empty()) { result.emplace_back(token); }
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
  }
  return result;
}

std::string util_join(std::vector<std::string> const &parts, std::string_view separator) {
  std::string result;
  for (size_t i{}; i < parts.size(); ++i) {
    if (i > 0) { result.append(separator); }
    result.append(parts[i]);
  }
  return result;
}

std::string util_to_lower(std::string_view value) {
  std::string result{ value };
  std::ranges::transform(result, result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_inflate(std::string_view compressed, bool gzip) {
  z_stream strm{};
  strm.next_in = const_cast<Bytef *>(reinterpret_cast<Bytef const *>(compressed.data()));
  strm.avail_in = static_cast<uInt>(compressed.size());

  // 16 + MAX_WBITS enables gzip header detection
  if (inflateInit2(&strm, gzip ? 16 + MAX_WBITS : MAX_WBITS) != Z_OK) {
    throw std::runtime_error("util_inflate: failed to initialize zlib");
  }

  std::string decompressed;
  decompressed.resize(std::max<size_t>(compressed.size() * 4, 4096));

  strm.next_out = reinterpret_cast<Bytef *>(decompressed.data());
  strm.avail_out = static_cast<uInt>(decompressed.size());

  int ret{ Z_OK };
  while (ret != Z_STREAM_END) {
    ret = inflate(&strm, Z_NO_FLUSH);
    if (ret == Z_BUF_ERROR && strm.avail_out == 0) {
      size_t const old_size{ decompressed.size() };
      decompressed.resize(old_size * 2);
      strm.next_out = reinterpret_cast<Bytef *>(decompressed.data() + old_size);
      strm.avail_out = static_cast<uInt>(old_size);
    } else if (ret == Z_OK && strm.avail_out == 0) {
      size_t const old_size{ decompressed.size() };
      decompressed.resize(old_size * 2);
      strm.next_out = reinterpret_cast<Bytef *>(decompressed.data() + old_size);
      strm.avail_out = static_cast<uInt>(old_size);
    } else if (ret == Z_BUF_ERROR || (ret == Z_OK && strm.avail_in == 0)) {
      inflateEnd(&strm);
      throw std::runtime_error("util_inflate: truncated input");
    } else if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&strm);
      throw std::runtime_error("util_inflate: corrupt input (zlib error " +
                               std::to_string(ret) + ")");
    }
  }

  size_t const total_size{ strm.total_out };
  inflateEnd(&strm);

  decompressed.resize(total_size);
  return decompressed;
}

}  // namespace gemfetch
