#include "credentials.h"

#include "doctest.h"

namespace gemfetch {

TEST_CASE("credential_scoped_uri keeps embedded credentials") {
  credential_scoped_uri const remote{ uri_parse("https://u:p@gems.example.com/") };
  CHECK(remote.has_credentials());
  CHECK(remote.to_string() == "https://gems.example.com/");
  CHECK(remote.original().user == "u");
  CHECK(remote.without_credentials().user.empty());
}

TEST_CASE("credential_scoped_uri configured auth replaces embedded credentials") {
  credential_scoped_uri const remote{ uri_parse("https://u:p@gems.example.com/"),
                                      std::string{ "other:secret" } };
  CHECK(remote.original().user == "other");
  CHECK(remote.original().password == std::optional<std::string>{ "secret" });
  CHECK(remote.to_string().find("secret") == std::string::npos);

  credential_scoped_uri const token{ uri_parse("https://gems.example.com/"),
                                     std::string{ "abc123" } };
  CHECK(token.original().user == "abc123");
  CHECK_FALSE(token.original().password.has_value());
}

TEST_CASE("credentials_normalize_source adds a trailing slash") {
  CHECK(credentials_normalize_source("https://gems.example.com").to_string() ==
        "https://gems.example.com/");
  CHECK(credentials_normalize_source("https://gems.example.com/private").to_string() ==
        "https://gems.example.com/private/");
}

TEST_CASE("credentials_mirror_for") {
  auto const source{ credentials_normalize_source("https://rubygems.org/") };

  SUBCASE("exact mirror") {
    settings const s{ { { "mirror.https://rubygems.org/", "https://mirror.example.com" } } };
    CHECK(credentials_mirror_for(source, s).to_string() == "https://mirror.example.com/");
  }

  SUBCASE("mirror without trailing slash") {
    settings const s{ { { "mirror.https://rubygems.org", "https://m2.example.com/" } } };
    CHECK(credentials_mirror_for(source, s).to_string() == "https://m2.example.com/");
  }

  SUBCASE("mirror for all") {
    settings const s{ { { "mirror.all", "https://all.example.com" } } };
    CHECK(credentials_mirror_for(source, s).to_string() == "https://all.example.com/");
  }

  SUBCASE("no mirror") {
    CHECK(credentials_mirror_for(source, settings{}) == source);
  }
}

TEST_CASE("credentials_lookup by uri, then host") {
  auto const source{ credentials_normalize_source("https://gems.example.com/private") };

  settings const by_uri{ { { "https://gems.example.com/private/", "a:b" },
                           { "gems.example.com", "c:d" } } };
  CHECK(credentials_lookup(source, by_uri) == std::optional<std::string>{ "a:b" });

  settings const by_host{ { { "GEMFETCH_GEMS__EXAMPLE__COM", "c:d" } } };
  CHECK(credentials_lookup(source, by_host) == std::optional<std::string>{ "c:d" });

  CHECK_FALSE(credentials_lookup(source, settings{}).has_value());
}

TEST_CASE("credentials_resolve applies mirror then credentials") {
  settings const s{ { { "mirror.all", "https://mirror.example.com" },
                      { "mirror.example.com", "user:pw" } } };
  auto const remote{ credentials_resolve("https://rubygems.org", s) };
  CHECK(remote.to_string() == "https://mirror.example.com/");
  CHECK(remote.original().user == "user");
  CHECK(remote.original().password == std::optional<std::string>{ "pw" });
}

}  // namespace gemfetch
