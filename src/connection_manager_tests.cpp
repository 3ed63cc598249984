#include "connection_manager.h"

#include "fetch_error.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>

namespace gemfetch {

TEST_CASE("parse_tls_verify_mode") {
  CHECK(parse_tls_verify_mode("peer") == tls_verify_mode::PEER);
  CHECK(parse_tls_verify_mode(" 1 ") == tls_verify_mode::PEER);
  CHECK(parse_tls_verify_mode("NONE") == tls_verify_mode::NONE);
  CHECK(parse_tls_verify_mode("0") == tls_verify_mode::NONE);
  CHECK_THROWS_AS(parse_tls_verify_mode("strict"), std::invalid_argument);
}

TEST_CASE("connection_manager reuses one connection per origin") {
  auto transport{ std::make_shared<test::scripted_transport>() };
  connection_manager mgr{ fetch_config{}, transport };

  auto &a{ mgr.connect(uri_parse("https://gems.example.com/a")) };
  auto &b{ mgr.connect(uri_parse("https://gems.example.com:443/b?x=1")) };
  auto &c{ mgr.connect(uri_parse("https://other.example.com/")) };

  CHECK(&a == &b);
  CHECK(&a != &c);
  CHECK(mgr.connection_count() == 2);
  CHECK(transport->opened_origins().size() == 2);
}

TEST_CASE("connection_manager passes timeout, agent and tls options") {
  fetch_config cfg{};
  cfg.read_timeout = std::chrono::seconds{ 3 };
  cfg.user_agent = "agent/1";
  cfg.ssl_verify_mode = "none";

  auto transport{ std::make_shared<test::scripted_transport>() };
  connection_manager mgr{ cfg, transport };
  mgr.connect(uri_parse("https://gems.example.com/"));

  auto const opts{ transport->opened_options() };
  REQUIRE(opts.size() == 1);
  CHECK(opts[0].read_timeout == std::chrono::seconds{ 3 });
  CHECK(opts[0].user_agent == "agent/1");
  REQUIRE(opts[0].tls.has_value());
  CHECK(opts[0].tls->verify == tls_verify_mode::NONE);
}

TEST_CASE("connection_manager plain http carries no tls options") {
  auto transport{ std::make_shared<test::scripted_transport>(false) };
  connection_manager mgr{ fetch_config{}, transport };
  mgr.connect(uri_parse("http://gems.example.com/"));

  auto const opts{ transport->opened_options() };
  REQUIRE(opts.size() == 1);
  CHECK_FALSE(opts[0].tls.has_value());
}

TEST_CASE("connection_manager reports missing TLS support") {
  auto transport{ std::make_shared<test::scripted_transport>(false) };
  connection_manager mgr{ fetch_config{}, transport };

  try {
    mgr.connect(uri_parse("https://gems.example.com/"));
    FAIL("expected fetch_error");
  } catch (fetch_error const &err) {
    CHECK(err.kind() == fetch_error_kind::TLS_UNAVAILABLE);
  }
  CHECK(transport->opened_origins().empty());
}

TEST_CASE("connection_manager rejects a missing client certificate") {
  fetch_config cfg{};
  cfg.ssl_client_cert = std::filesystem::path{ "/nonexistent/gemfetch/client.pem" };
  CHECK_THROWS_AS(connection_manager(cfg, std::make_shared<test::scripted_transport>()),
                  std::runtime_error);
}

TEST_CASE("load_bundled_certificates concatenates pem files in order") {
  auto const dir{ std::filesystem::temp_directory_path() / "gemfetch_certs_test" };
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  std::ofstream{ dir / "b.pem" } << "B";
  std::ofstream{ dir / "a.pem" } << "A\n";
  std::ofstream{ dir / "ignored.txt" } << "X";

  auto const pem{ load_bundled_certificates(dir) };
  std::filesystem::remove_all(dir);

  CHECK(pem == "A\nB\n");
  CHECK(load_bundled_certificates(dir).empty());
}

}  // namespace gemfetch
