#include "uri.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {
namespace {

bool is_unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

bool is_scheme_char(unsigned char c) {
  return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

std::string remove_dot_segments(std::string_view path) {
  if (path.empty()) { return {}; }

  std::vector<std::string_view> segments;
  bool const absolute{ path.front() == '/' };
  bool const trailing_slash{ path.back() == '/' || path.ends_with("/.") ||
                             path.ends_with("/..") || path == "." || path == ".." };

  for (std::string_view sv{ path }; !sv.empty();) {
    auto const pos{ sv.find('/') };
    auto const segment{ sv.substr(0, pos) };
    if (segment == "..") {
      if (!segments.empty()) { segments.pop_back(); }
    } else if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
  }

  std::string result{ absolute ? "/" : "" };
  for (size_t i{}; i < segments.size(); ++i) {
    if (i > 0) { result.push_back('/'); }
    result.append(segments[i]);
  }
  if (trailing_slash && !segments.empty()) { result.push_back('/'); }
  return result;
}

void parse_authority(std::string_view authority, uri &out) {
  if (auto const at{ authority.rfind('@') }; at != std::string_view::npos) {
    auto const userinfo{ authority.substr(0, at) };
    authority = authority.substr(at + 1);

    if (auto const colon{ userinfo.find(':') }; colon != std::string_view::npos) {
      out.user = std::string{ userinfo.substr(0, colon) };
      out.password = std::string{ userinfo.substr(colon + 1) };
    } else {
      out.user = std::string{ userinfo };
    }
  }

  std::string_view port_text;
  if (!authority.empty() && authority.front() == '[') {
    auto const close{ authority.find(']') };
    if (close == std::string_view::npos) {
      throw std::invalid_argument("uri_parse: unterminated IPv6 host");
    }
    out.host = std::string{ authority.substr(0, close + 1) };
    auto const rest{ authority.substr(close + 1) };
    if (!rest.empty()) {
      if (rest.front() != ':') {
        throw std::invalid_argument("uri_parse: unexpected text after IPv6 host");
      }
      port_text = rest.substr(1);
    }
  } else if (auto const colon{ authority.rfind(':') }; colon != std::string_view::npos) {
    out.host = std::string{ authority.substr(0, colon) };
    port_text = authority.substr(colon + 1);
  } else {
    out.host = std::string{ authority };
  }

  if (!port_text.empty()) {
    int port{ 0 };
    auto const [ptr, ec]{ std::from_chars(port_text.data(),
                                          port_text.data() + port_text.size(),
                                          port) };
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port <= 0 ||
        port > 65535) {
      throw std::invalid_argument("uri_parse: invalid port: " + std::string{ port_text });
    }
    out.port = port;
  }
}

}  // namespace

uri_scheme uri::kind() const {
  if (scheme == "https") { return uri_scheme::HTTPS; }
  if (scheme == "http") { return uri_scheme::HTTP; }
  if (scheme == "file") { return uri_scheme::LOCAL_FILE; }
  return uri_scheme::UNKNOWN;
}

int uri::effective_port() const {
  if (port) { return *port; }
  switch (kind()) {
    case uri_scheme::HTTPS: return 443;
    case uri_scheme::HTTP: return 80;
    default: return 0;
  }
}

std::string uri::origin() const {
  std::string result{ scheme + "://" + host };
  if (port) { result += ":" + std::to_string(*port); }
  return result;
}

std::string uri::request_target() const {
  std::string result{ path.empty() ? "/" : path };
  if (query) { result += "?" + *query; }
  return result;
}

std::string uri::to_string() const {
  std::string result{ scheme + "://" };
  if (has_credentials()) {
    result += user;
    if (password) { result += ":" + *password; }
    result += "@";
  }
  result += host;
  if (port) { result += ":" + std::to_string(*port); }
  result += path;
  if (query) { result += "?" + *query; }
  if (fragment) { result += "#" + *fragment; }
  return result;
}

uri uri_parse(std::string_view value) {
  auto const trimmed{ util_trim(value) };
  if (trimmed.empty()) { throw std::invalid_argument("uri_parse: empty value"); }

  auto const scheme_end{ trimmed.find("://") };
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    throw std::invalid_argument("uri_parse: missing scheme: " + std::string{ trimmed });
  }

  auto const scheme{ trimmed.substr(0, scheme_end) };
  if (!std::isalpha(static_cast<unsigned char>(scheme.front())) ||
      !std::ranges::all_of(scheme, [](char c) {
        return is_scheme_char(static_cast<unsigned char>(c));
      })) {
    throw std::invalid_argument("uri_parse: invalid scheme: " + std::string{ scheme });
  }

  uri result{};
  result.scheme = util_to_lower(scheme);

  std::string_view rest{ trimmed.substr(scheme_end + 3) };

  if (auto const hash{ rest.find('#') }; hash != std::string_view::npos) {
    result.fragment = std::string{ rest.substr(hash + 1) };
    rest = rest.substr(0, hash);
  }
  if (auto const question{ rest.find('?') }; question != std::string_view::npos) {
    result.query = std::string{ rest.substr(question + 1) };
    rest = rest.substr(0, question);
  }

  auto const slash{ rest.find('/') };
  auto const authority{ rest.substr(0, slash) };
  result.path = slash == std::string_view::npos ? "" : std::string{ rest.substr(slash) };

  parse_authority(authority, result);

  if (result.host.empty() && result.kind() != uri_scheme::LOCAL_FILE) {
    throw std::invalid_argument("uri_parse: missing host: " + std::string{ trimmed });
  }

  return result;
}

uri_scheme uri_classify(std::string_view value) {
  try {
    return uri_parse(value).kind();
  } catch (std::invalid_argument const &) { return uri_scheme::UNKNOWN; }
}

uri uri_without_credentials(uri const &value) {
  uri result{ value };
  result.user.clear();
  result.password.reset();
  return result;
}

uri uri_with_credentials(uri const &value,
                         std::string user,
                         std::optional<std::string> password) {
  uri result{ value };
  result.user = std::move(user);
  result.password = std::move(password);
  return result;
}

uri uri_resolve_reference(uri const &base, std::string_view reference) {
  auto const ref{ util_trim(reference) };
  if (ref.empty()) { throw std::invalid_argument("uri_resolve_reference: empty reference"); }

  if (ref.find("://") != std::string_view::npos) { return uri_parse(ref); }
  if (ref.starts_with("//")) { return uri_parse(base.scheme + ":" + std::string{ ref }); }

  uri result{ uri_without_credentials(base) };
  result.fragment.reset();
  result.query.reset();

  std::string_view path_part{ ref };
  if (auto const hash{ path_part.find('#') }; hash != std::string_view::npos) {
    path_part = path_part.substr(0, hash);
  }
  if (auto const question{ path_part.find('?') }; question != std::string_view::npos) {
    result.query = std::string{ path_part.substr(question + 1) };
    path_part = path_part.substr(0, question);
  }

  if (path_part.starts_with('/')) {
    result.path = remove_dot_segments(path_part);
  } else if (!path_part.empty()) {
    auto const dir_end{ base.path.rfind('/') };
    std::string merged{ dir_end == std::string::npos ? "/"
                                                     : base.path.substr(0, dir_end + 1) };
    merged.append(path_part);
    result.path = remove_dot_segments(merged);
  } else {
    result.path = base.path;
    if (!result.query) { result.query = base.query; }
  }

  return result;
}

uri uri_as_directory(uri const &value) {
  uri result{ value };
  if (result.path.empty() || result.path.back() != '/') { result.path.push_back('/'); }
  return result;
}

uri uri_join_path(uri const &base, std::string_view relative) {
  uri result{ uri_as_directory(base) };
  while (!relative.empty() && relative.front() == '/') { relative.remove_prefix(1); }
  result.path.append(relative);
  result.query.reset();
  result.fragment.reset();
  return result;
}

std::string uri_percent_encode(std::string_view value) {
  static constexpr char hex_chars[] = "0123456789ABCDEF";

  std::string result;
  result.reserve(value.size());
  for (char const ch : value) {
    auto const c{ static_cast<unsigned char>(ch) };
    if (is_unreserved(c)) {
      result.push_back(ch);
    } else {
      result.push_back('%');
      result.push_back(hex_chars[(c >> 4) & 0xf]);
      result.push_back(hex_chars[c & 0xf]);
    }
  }
  return result;
}

std::string uri_percent_decode(std::string_view value) {
  std::string result;
  result.reserve(value.size());
  for (size_t i{}; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      int const hi{ util_hex_char_to_int(value[i + 1]) };
      int const lo{ util_hex_char_to_int(value[i + 2]) };
      if (hi >= 0 && lo >= 0) {
        result.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    } else if (value[i] == '+') {
      result.push_back(' ');
      continue;
    }
    result.push_back(value[i]);
  }
  return result;
}

}  // namespace gemfetch
