#include "dependency_api.h"

#include "fetch_error.h"
#include "test_support.h"

#include "doctest.h"

#include <cstdio>
#include <stdexcept>

namespace gemfetch {

namespace {

struct api_fixture {
  explicit api_fixture(std::size_t limit = 100, int attempts = 1) {
    fetch_config const cfg{};
    transport = std::make_shared<test::scripted_transport>();
    auto client{ std::make_shared<http_client>(
        cfg, std::make_shared<connection_manager>(cfg, transport)) };
    api = std::make_unique<dependency_api_fetcher>(
        dependency_api_base(uri_parse("https://gems.example.com/")),
        client,
        retry_policy{ .max_attempts = attempts },
        limit);
  }

  void on(std::vector<std::string> const &names, test::scripted_reply reply) {
    transport->on(dependency_api_uri(api->base(), names).to_string(), std::move(reply));
  }

  std::shared_ptr<test::scripted_transport> transport;
  std::unique_ptr<dependency_api_fetcher> api;
};

}  // namespace

TEST_CASE("dependency_api_base rewrites rubygems.org") {
  CHECK(dependency_api_base(uri_parse("https://rubygems.org")).to_string() ==
        "https://bundler.rubygems.org/");
  CHECK(dependency_api_base(uri_parse("https://gems.example.com/private")).to_string() ==
        "https://gems.example.com/private/");
}

TEST_CASE("dependency_api_uri encodes each name") {
  auto const base{ uri_parse("https://gems.example.com/") };
  CHECK(dependency_api_uri(base).to_string() == "https://gems.example.com/api/v1/dependencies");
  CHECK(dependency_api_uri(base, { "rack", "net-http", "a b" }).to_string() ==
        "https://gems.example.com/api/v1/dependencies?gems=rack,net-http,a%20b");
  CHECK(dependency_api_uri(base, { "x,y" }).to_string() ==
        "https://gems.example.com/api/v1/dependencies?gems=x%2Cy");
}

TEST_CASE("dependency_api_batches") {
  std::vector<std::string> names;
  for (int i{ 0 }; i < 250; ++i) { names.push_back("g" + std::to_string(i)); }

  auto const batches{ dependency_api_batches(names, 100) };
  REQUIRE(batches.size() == 3);
  CHECK(batches[0].size() == 100);
  CHECK(batches[2].size() == 50);
  CHECK(batches[1].front() == "g100");

  CHECK(dependency_api_batches({}, 100).empty());
  CHECK_THROWS_AS(dependency_api_batches(names, 0), std::invalid_argument);
}

TEST_CASE("dependency_api_decode reads array and hash dependency forms") {
  test::marshal_builder b;
  b.array(2);
  b.hash(4)
      .symbol("name").str("rack-test")
      .symbol("number").str("2.1.0")
      .symbol("platform").str("ruby")
      .symbol("dependencies").array(1).array(2).str("rack").str(">= 1.3, < 4");
  b.hash(4)
      .symbol("name").str("nokogiri")
      .symbol("number").str("1.15.0")
      .symbol("platform").str("java")
      .symbol("dependencies").hash(1).str("racc").str("~> 1.4");

  auto const specs{ dependency_api_decode(b.bytes(), "https://h/") };
  REQUIRE(specs.size() == 2);
  CHECK(specs[0].name == "rack-test");
  REQUIRE(specs[0].dependencies.has_value());
  CHECK((*specs[0].dependencies)[0].to_string() == "rack (>= 1.3, < 4)");
  CHECK(specs[1].platform == "java");
  CHECK((*specs[1].dependencies)[0].requirement.to_string() == "~> 1.4");
}

TEST_CASE("dependency_api_decode treats an empty requirement as >= 0") {
  auto const specs{ dependency_api_decode(
      test::make_dependency_response({ { .name = "a", .number = "1.0",
                                         .dependencies = { { "b", "" } } } }),
      "https://h/") };
  CHECK((*specs[0].dependencies)[0].requirement.is_default());
}

TEST_CASE("dependency_api_decode failures") {
  SUBCASE("malformed requirement") {
    auto const body{ test::make_dependency_response(
        { { .name = "a", .number = "1.0", .dependencies = { { "b", "=> 1.0" } } } }) };
    try {
      dependency_api_decode(body, "https://h/");
      FAIL("expected fetch_error");
    } catch (fetch_error const &err) {
      CHECK(err.kind() == fetch_error_kind::MALFORMED_SPEC);
      CHECK(std::string{ err.what() }.find("a-1.0") != std::string::npos);
    }
  }

  SUBCASE("malformed version") {
    auto const body{ test::make_dependency_response({ { .name = "a", .number = "x.y" } }) };
    try {
      dependency_api_decode(body, "https://h/");
      FAIL("expected fetch_error");
    } catch (fetch_error const &err) {
      CHECK(err.kind() == fetch_error_kind::MALFORMED_SPEC);
    }
  }

  SUBCASE("undecodable body") {
    try {
      dependency_api_decode("<html>", "https://h/api");
      FAIL("expected fetch_error");
    } catch (fetch_error const &err) {
      CHECK(err.kind() == fetch_error_kind::HTTP_ERROR);
      CHECK(std::string{ err.what() }.starts_with("Invalid dependency data from https://h/api."));
    }
  }
}

TEST_CASE("resolve_closure follows dependencies across rounds") {
  api_fixture f;
  f.on({ "a" },
       test::reply_ok(test::make_dependency_response(
           { { .name = "a", .number = "1.0", .dependencies = { { "b", ">= 0" } } },
             { .name = "a", .number = "2.0", .dependencies = { { "b", ">= 1" } } } })));
  f.on({ "b" },
       test::reply_ok(test::make_dependency_response(
           { { .name = "b", .number = "1.0", .dependencies = { { "a", ">= 0" } } } })));

  auto const closure{ f.api->resolve_closure({ "a" }) };
  CHECK(closure.rounds == 2);
  CHECK(closure.requests == 2);
  CHECK(closure.fully_queried == std::set<std::string>{ "a", "b" });
  CHECK(closure.specs.size() == 3);
  CHECK(f.transport->request_count() == 2);
}

TEST_CASE("resolve_closure with no names makes no request") {
  api_fixture f;
  auto const closure{ f.api->resolve_closure({}) };
  CHECK(closure.rounds == 0);
  CHECK(closure.requests == 0);
  CHECK(closure.specs.empty());
  CHECK(f.transport->request_count() == 0);
}

TEST_CASE("resolve_closure batches large rounds") {
  api_fixture f{ 100 };
  std::vector<std::string> names;
  for (int i{ 0 }; i < 250; ++i) {
    char buf[8];
    std::snprintf(buf, sizeof buf, "g%03d", i);
    names.emplace_back(buf);
  }
  for (auto const &batch : dependency_api_batches(names, 100)) {
    f.on(batch, test::reply_ok(test::make_dependency_response({})));
  }

  auto const closure{ f.api->resolve_closure(names) };
  CHECK(closure.rounds == 1);
  CHECK(closure.requests == 3);
  CHECK(closure.fully_queried.size() == 250);
  CHECK(f.transport->request_count() == 3);
}

TEST_CASE("resolve_closure aborts on failure") {
  api_fixture f{ 100, 2 };
  f.on({ "a" },
       test::reply_ok(test::make_dependency_response(
           { { .name = "a", .number = "1.0", .dependencies = { { "b", ">= 0" } } } })));
  f.on({ "b" }, test::reply_status(500));

  try {
    f.api->resolve_closure({ "a" });
    FAIL("expected fetch_error");
  } catch (fetch_error const &err) {
    CHECK(err.kind() == fetch_error_kind::HTTP_ERROR);
    CHECK(err.status() == std::optional<int>{ 500 });
  }
  CHECK(f.transport->request_count() == 3);
}

TEST_CASE("resolve_closure does not retry authentication failures") {
  api_fixture f{ 100, 3 };
  f.on({ "a" }, test::reply_status(401));
  CHECK_THROWS_AS(f.api->resolve_closure({ "a" }), fetch_error);
  CHECK(f.transport->request_count() == 1);
}

TEST_CASE("dependency_api_fetcher validates its arguments") {
  CHECK_THROWS_AS(dependency_api_fetcher(uri_parse("https://h/"), nullptr, retry_policy{}, 1),
                  std::invalid_argument);

  fetch_config const cfg{};
  auto client{ std::make_shared<http_client>(
      cfg,
      std::make_shared<connection_manager>(cfg,
                                           std::make_shared<test::scripted_transport>())) };
  CHECK_THROWS_AS(dependency_api_fetcher(uri_parse("https://h/"), client, retry_policy{}, 0),
                  std::invalid_argument);
}

}  // namespace gemfetch
