#include "full_index.h"

#include "fetch_error.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>

namespace gemfetch {

namespace {

constexpr char kSpecs[]{ "https://gems.example.com/specs.4.8.gz" };
constexpr char kPrerelease[]{ "https://gems.example.com/prerelease_specs.4.8.gz" };

struct index_fixture {
  index_fixture() {
    fetch_config const cfg{};
    transport = std::make_shared<test::scripted_transport>();
    client = std::make_unique<http_client>(
        cfg, std::make_shared<connection_manager>(cfg, transport));
  }

  fetch_error_kind fetch_kind(credential_scoped_uri const &registry) {
    try {
      full_index_fetch(registry, *client);
    } catch (fetch_error const &err) {
      message = err.what();
      return err.kind();
    }
    FAIL("expected fetch_error");
    return fetch_error_kind::HTTP_ERROR;
  }

  std::shared_ptr<test::scripted_transport> transport;
  std::unique_ptr<http_client> client;
  std::string message;
};

credential_scoped_uri registry(char const *text = "https://gems.example.com/") {
  return credential_scoped_uri{ uri_parse(text) };
}

}  // namespace

TEST_CASE("full_index_decode") {
  auto const entries{ full_index_decode(test::make_full_index(
      { { "rack", "2.2.3" }, { "nokogiri", "1.15.0", "x86_64-linux" } })) };
  REQUIRE(entries.size() == 2);
  CHECK(entries[0].name == "rack");
  CHECK(entries[0].version.to_string() == "2.2.3");
  CHECK(entries[0].platform == "ruby");
  CHECK_FALSE(entries[0].dependencies.has_value());
  CHECK(entries[1].platform == "x86_64-linux");
}

TEST_CASE("full_index_fetch merges release and prerelease indexes") {
  index_fixture f;
  f.transport->on(kSpecs, test::reply_ok(test::make_full_index({ { "rack", "2.2.3" } })));
  f.transport->on(kPrerelease,
                  test::reply_ok(test::make_full_index({ { "rack", "3.0.0.beta1" } })));

  auto const entries{ full_index_fetch(registry(), *f.client) };
  REQUIRE(entries.size() == 2);
  CHECK(entries[1].version.prerelease());
}

TEST_CASE("full_index_fetch tolerates a missing prerelease index") {
  index_fixture f;
  f.transport->on(kSpecs, test::reply_ok(test::make_full_index({ { "rack", "2.2.3" } })));
  CHECK(full_index_fetch(registry(), *f.client).size() == 1);
}

TEST_CASE("full_index_fetch maps authentication failures") {
  index_fixture f;

  SUBCASE("401") {
    f.transport->on(kSpecs, test::reply_status(401));
    CHECK(f.fetch_kind(registry()) == fetch_error_kind::AUTHENTICATION_REQUIRED);
    CHECK(f.message.find("https://gems.example.com/") != std::string::npos);
  }

  SUBCASE("403 with credentials") {
    f.transport->on(kSpecs, test::reply_status(403));
    CHECK(f.fetch_kind(registry("https://u:p@gems.example.com/")) ==
          fetch_error_kind::BAD_AUTHENTICATION);
    CHECK(f.message.find("u:p") == std::string::npos);
  }

  SUBCASE("403 without credentials") {
    f.transport->on(kSpecs, test::reply_status(403));
    CHECK(f.fetch_kind(registry()) == fetch_error_kind::AUTHENTICATION_REQUIRED);
  }
}

TEST_CASE("full_index_fetch passes certificate failures through") {
  index_fixture f;
  f.transport->on(kSpecs, test::reply_fault(transport_fault_kind::TLS_FAILURE));
  CHECK(f.fetch_kind(registry()) == fetch_error_kind::CERTIFICATE_FAILURE);
}

TEST_CASE("full_index_fetch reports other failures generically") {
  index_fixture f;

  SUBCASE("server error") { f.transport->on(kSpecs, test::reply_status(500, "down")); }
  SUBCASE("missing index") {}
  SUBCASE("host unreachable") {
    f.transport->on(kSpecs, test::reply_fault(transport_fault_kind::HOST_UNREACHABLE));
  }
  SUBCASE("corrupt body") { f.transport->on(kSpecs, test::reply_ok("garbage")); }

  CHECK(f.fetch_kind(registry()) == fetch_error_kind::HTTP_ERROR);
  CHECK(f.message == "Could not fetch specs from https://gems.example.com/");
}

TEST_CASE("full_index_fetch reads file registries") {
  auto const dir{ std::filesystem::temp_directory_path() / "gemfetch_full_index_test" };
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  {
    auto const body{ test::make_full_index({ { "rake", "13.0" } }) };
    std::ofstream out{ dir / "specs.4.8.gz", std::ios::binary };
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
  }

  index_fixture f;
  auto const remote{ credential_scoped_uri{
      credentials_normalize_source("file://" + dir.string()) } };

  auto const entries{ full_index_fetch(remote, *f.client) };
  std::filesystem::remove_all(dir);

  REQUIRE(entries.size() == 1);
  CHECK(entries[0].name == "rake");
  CHECK(f.transport->request_count() == 0);
}

}  // namespace gemfetch
