#include "cmd_specs.h"

#include "fetch_error.h"
#include "test_support.h"

#include "doctest.h"

#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace gemfetch {

namespace {

// One scripted transport per session, handed out in creation order.
struct transport_pool {
  transport_factory_t factory() {
    return [this] {
      std::lock_guard lock{ mutex };
      auto transport{ std::make_shared<test::scripted_transport>() };
      for (auto const &[url, body] : routes) { transport->on(url, test::reply_ok(body)); }
      created.push_back(transport);
      return std::shared_ptr<http_transport>{ transport };
    };
  }

  std::map<std::string, std::string> routes;
  std::mutex mutex;
  std::vector<std::shared_ptr<test::scripted_transport>> created;
};

cmd_specs::cfg make_cfg(std::vector<std::string> names, std::vector<std::string> sources) {
  cmd_specs::cfg cfg{};
  cfg.names = std::move(names);
  cfg.sources = std::move(sources);
  return cfg;
}

}  // namespace

TEST_CASE("cmd_specs::fetch_all fetches every source") {
  transport_pool pool;
  pool.routes["https://a.example.com/specs.4.8.gz"] =
      test::make_full_index({ { "rack", "2.2.3" }, { "rake", "13.0" } });
  pool.routes["https://b.example.com/specs.4.8.gz"] =
      test::make_full_index({ { "rack", "3.0.0" } });

  auto const results{ cmd_specs::fetch_all(
      make_cfg({}, { "https://a.example.com", "https://b.example.com" }),
      settings{},
      pool.factory()) };

  REQUIRE(results.size() == 2);
  CHECK(results[0].size() == 2);
  CHECK(results[1].size() == 1);
  CHECK(results[1].search("rack")[0]->source() == "https://b.example.com");
  CHECK(pool.created.size() == 2);
}

TEST_CASE("cmd_specs::fetch_all resolves names through the dependency API") {
  transport_pool pool;
  pool.routes["https://a.example.com/api/v1/dependencies"] = "";
  pool.routes["https://a.example.com/api/v1/dependencies?gems=rack"] =
      test::make_dependency_response({ { .name = "rack", .number = "2.2.3" } });

  auto const results{ cmd_specs::fetch_all(
      make_cfg({ "rack" }, { "https://a.example.com" }), settings{}, pool.factory()) };

  REQUIRE(results.size() == 1);
  CHECK(results[0].size() == 1);
  CHECK_FALSE(results[0].search("rack")[0]->lazy());
}

TEST_CASE("cmd_specs::fetch_all propagates a session failure") {
  transport_pool pool;
  pool.routes["https://a.example.com/specs.4.8.gz"] = test::make_full_index({ { "rack", "2.2.3" } });

  settings const s{ { { "retry_delay_ms", "0" } } };
  CHECK_THROWS_AS(cmd_specs::fetch_all(make_cfg({}, { "https://a.example.com", "https://b.example.com" }),
                                       s,
                                       pool.factory()),
                  fetch_error);
}

TEST_CASE("cmd_specs::fetch_all requires a source") {
  transport_pool pool;
  CHECK_THROWS_AS(cmd_specs::fetch_all(make_cfg({ "rack" }, {}), settings{}, pool.factory()),
                  std::invalid_argument);
  CHECK(pool.created.empty());
}

TEST_CASE("cmd_specs::format") {
  auto const index{ spec_index_build(
      { raw_spec{ .name = "rack",
                  .version = gem_version::parse("3.0.0"),
                  .dependencies = std::vector<gem_dependency>{
                      { .name = "webrick", .requirement = gem_requirement::parse("~> 1.8") } } },
        raw_spec{ .name = "rack",
                  .version = gem_version::parse("2.2.3"),
                  .dependencies = std::vector<gem_dependency>{} },
        raw_spec{ .name = "nokogiri",
                  .version = gem_version::parse("1.15.0"),
                  .platform = "java",
                  .dependencies = std::vector<gem_dependency>{} } },
      spec_index_build_options{ .source = "main" }) };

  CHECK(cmd_specs::format(index, false) ==
        std::vector<std::string>{ "nokogiri (1.15.0-java)", "rack (2.2.3)", "rack (3.0.0)" });
  CHECK(cmd_specs::format(index, true) == std::vector<std::string>{ "nokogiri (1.15.0-java)",
                                                                    "rack (2.2.3)",
                                                                    "rack (3.0.0)",
                                                                    "  webrick (~> 1.8)" });
}

}  // namespace gemfetch
