#include "libcurl_util.h"

#include "fetch_error.h"
#include "platform.h"
#include "util.h"

#include <curl/curl.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace gemfetch {

namespace {

using curl_handle_t = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_slist_t = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t curl_write_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *body{ static_cast<std::string *>(userdata) };
  size_t const total{ size * nmemb };
  body->append(ptr, total);
  return total;
}

size_t curl_write_header(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *headers{ static_cast<http_headers *>(userdata) };
  size_t const total{ size * nmemb };
  std::string_view const line{ util_trim(std::string_view{ ptr, total }) };

  // A new status line starts a new header block (interim 1xx responses).
  if (line.starts_with("HTTP/")) {
    headers->clear();
    return total;
  }

  if (auto const colon{ line.find(':') }; colon != std::string_view::npos && colon > 0) {
    (*headers)[util_to_lower(util_trim(line.substr(0, colon)))] =
        std::string{ util_trim(line.substr(colon + 1)) };
  }
  return total;
}

transport_fault_kind fault_kind_from_curl(CURLcode code) {
  switch (code) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY: return transport_fault_kind::DNS_FAILURE;
    case CURLE_COULDNT_CONNECT: return transport_fault_kind::HOST_UNREACHABLE;
    case CURLE_OPERATION_TIMEDOUT: return transport_fault_kind::TIMEOUT;
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE: return transport_fault_kind::CONNECTION_RESET;
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_SSL_ISSUER_ERROR:
    case CURLE_SSL_CRL_BADFILE:
    case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
    case CURLE_SSL_INVALIDCERTSTATUS: return transport_fault_kind::TLS_FAILURE;
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_WEIRD_SERVER_REPLY:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
    case CURLE_BAD_CONTENT_ENCODING: return transport_fault_kind::PROTOCOL_ERROR;
    default: return transport_fault_kind::OTHER;
  }
}

std::string load_text_file(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ bytes.begin(), bytes.end() };
}

class curl_connection : public http_connection {
 public:
  curl_connection(std::string origin, connection_options const &options)
      : origin_{ std::move(origin) }, handle_{ curl_easy_init(), &curl_easy_cleanup } {
    if (!handle_) { throw std::runtime_error("curl_easy_init failed"); }

    setopt(CURLOPT_NOSIGNAL, 1L);
    setopt(CURLOPT_FOLLOWLOCATION, 0L);
    setopt(CURLOPT_TCP_KEEPALIVE, 1L);
    setopt(CURLOPT_NOPROGRESS, 1L);
    setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.read_timeout.count()));

    // No data for read_timeout aborts the transfer.
    setopt(CURLOPT_LOW_SPEED_LIMIT, 1L);
    setopt(CURLOPT_LOW_SPEED_TIME,
           std::max(1L, static_cast<long>(options.read_timeout.count() / 1000)));

    user_agent_ = options.user_agent;
    if (!user_agent_.empty()) { setopt(CURLOPT_USERAGENT, user_agent_.c_str()); }

    if (options.tls) { configure_tls(*options.tls); }
  }

  http_response request(http_request const &req) override {
    http_response response;

    setopt(CURLOPT_URL, req.url.c_str());
    if (req.method == "GET") {
      setopt(CURLOPT_HTTPGET, 1L);
      setopt(CURLOPT_CUSTOMREQUEST, static_cast<char const *>(nullptr));
    } else {
      setopt(CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }

    if (req.basic_auth_user) {
      setopt(CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
      setopt(CURLOPT_USERNAME, req.basic_auth_user->c_str());
      setopt(CURLOPT_PASSWORD,
             req.basic_auth_password ? req.basic_auth_password->c_str() : "");
    } else {
      setopt(CURLOPT_USERNAME, static_cast<char const *>(nullptr));
      setopt(CURLOPT_PASSWORD, static_cast<char const *>(nullptr));
    }

    curl_slist_t header_list{ nullptr, &curl_slist_free_all };
    for (auto const &[name, value] : req.headers) {
      std::string const line{ name + ": " + value };
      curl_slist *appended{ curl_slist_append(header_list.get(), line.c_str()) };
      if (!appended) { throw std::runtime_error("curl_slist_append failed"); }
      header_list.release();
      header_list.reset(appended);
    }
    setopt(CURLOPT_HTTPHEADER, header_list.get());

    setopt(CURLOPT_WRITEFUNCTION, curl_write_string);
    setopt(CURLOPT_WRITEDATA, &response.body);
    setopt(CURLOPT_HEADERFUNCTION, curl_write_header);
    setopt(CURLOPT_HEADERDATA, &response.headers);
    error_buffer_[0] = '\0';
    setopt(CURLOPT_ERRORBUFFER, error_buffer_);

    CURLcode const rc{ curl_easy_perform(handle_.get()) };
    setopt(CURLOPT_HTTPHEADER, static_cast<curl_slist *>(nullptr));

    if (rc != CURLE_OK) {
      std::string detail{ curl_easy_strerror(rc) };
      if (error_buffer_[0] != '\0') { detail += std::string{ ": " } + error_buffer_; }
      throw transport_fault{ fault_kind_from_curl(rc), std::move(detail) };
    }

    long status{ 0 };
    curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);

    char *primary_ip{ nullptr };
    if (curl_easy_getinfo(handle_.get(), CURLINFO_PRIMARY_IP, &primary_ip) == CURLE_OK &&
        primary_ip) {
      response.peer = platform::peer_display_name(primary_ip);
    }

    return response;
  }

 private:
  template <typename T>
  void setopt(CURLoption option, T value) {
    CURLcode const rc{ curl_easy_setopt(handle_.get(), option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  }

  void configure_tls(tls_options const &tls) {
    bool const verify{ tls.verify == tls_verify_mode::PEER };
    setopt(CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
    setopt(CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

    if (tls.ca_file) {
      ca_file_ = tls.ca_file->string();
      setopt(CURLOPT_CAINFO, ca_file_.c_str());
    } else if (tls.ca_dir) {
      ca_dir_ = tls.ca_dir->string();
      setopt(CURLOPT_CAPATH, ca_dir_.c_str());
    } else if (!tls.extra_ca_pem.empty()) {
      // System roots plus the supplementary bundle, handed to curl in memory.
      char *default_cainfo{ nullptr };
      if (curl_easy_getinfo(handle_.get(), CURLINFO_CAINFO, &default_cainfo) == CURLE_OK &&
          default_cainfo && std::filesystem::exists(default_cainfo)) {
        ca_blob_ = load_text_file(default_cainfo);
        if (!ca_blob_.empty() && ca_blob_.back() != '\n') { ca_blob_.push_back('\n'); }
      }
      ca_blob_ += tls.extra_ca_pem;

      curl_blob blob{};
      blob.data = ca_blob_.data();
      blob.len = ca_blob_.size();
      blob.flags = CURL_BLOB_NOCOPY;
      setopt(CURLOPT_CAINFO_BLOB, &blob);
    }

    if (tls.client_cert) {
      client_cert_ = tls.client_cert->string();
      setopt(CURLOPT_SSLCERTTYPE, "PEM");
      setopt(CURLOPT_SSLCERT, client_cert_.c_str());
      setopt(CURLOPT_SSLKEY, client_cert_.c_str());
    }
  }

  std::string origin_;
  curl_handle_t handle_;
  std::string user_agent_;
  std::string ca_file_;
  std::string ca_dir_;
  std::string ca_blob_;
  std::string client_cert_;
  char error_buffer_[CURL_ERROR_SIZE]{};
};

class curl_transport : public http_transport {
 public:
  curl_transport() { libcurl_ensure_initialized(); }

  bool tls_available() const override {
    curl_version_info_data const *info{ curl_version_info(CURLVERSION_NOW) };
    return info && (info->features & CURL_VERSION_SSL) != 0;
  }

  std::unique_ptr<http_connection> open(std::string const &origin,
                                        connection_options const &options) override {
    return std::make_unique<curl_connection>(origin, options);
  }
};

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

std::string libcurl_version_string() {
  curl_version_info_data const *info{ curl_version_info(CURLVERSION_NOW) };
  return std::string{ "curl/" } + (info && info->version ? info->version : "unknown");
}

std::unique_ptr<http_transport> libcurl_make_transport() {
  return std::make_unique<curl_transport>();
}

}  // namespace gemfetch
