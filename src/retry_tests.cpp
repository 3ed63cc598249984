#include "retry.h"

#include "doctest.h"

namespace gemfetch {

namespace {

fetch_error make_error(fetch_error_kind kind) {
  return fetch_error{ kind, "https://h/", "failure" };
}

}  // namespace

TEST_CASE("retry_attempt returns on the first success") {
  int calls{ 0 };
  auto const result{ retry_attempt(retry_policy{}, "op", [&] {
    ++calls;
    return 7;
  }) };
  CHECK(result == 7);
  CHECK(calls == 1);
}

TEST_CASE("retry_attempt succeeds on a later attempt") {
  int calls{ 0 };
  auto const result{ retry_attempt(retry_policy{ .max_attempts = 3 }, "op", [&] {
    if (++calls < 3) { throw make_error(fetch_error_kind::HTTP_ERROR); }
    return std::string{ "ok" };
  }) };
  CHECK(result == "ok");
  CHECK(calls == 3);
}

TEST_CASE("retry_attempt rethrows the last failure when attempts run out") {
  int calls{ 0 };
  CHECK_THROWS_AS(retry_attempt(retry_policy{ .max_attempts = 2 },
                                "op",
                                [&]() -> int {
                                  ++calls;
                                  throw make_error(fetch_error_kind::NETWORK_DOWN);
                                }),
                  fetch_error);
  CHECK(calls == 2);
}

TEST_CASE("retry_attempt aborts immediately on authentication failures") {
  for (auto const kind : { fetch_error_kind::AUTHENTICATION_REQUIRED,
                           fetch_error_kind::BAD_AUTHENTICATION,
                           fetch_error_kind::CERTIFICATE_FAILURE }) {
    int calls{ 0 };
    CHECK_THROWS_AS(retry_attempt(retry_policy{ .max_attempts = 5 },
                                  "op",
                                  [&]() -> int {
                                    ++calls;
                                    throw make_error(kind);
                                  }),
                    fetch_error);
    CHECK(calls == 1);
  }
}

TEST_CASE("retry_attempt does not retry other exceptions") {
  int calls{ 0 };
  CHECK_THROWS_AS(retry_attempt(retry_policy{},
                                "op",
                                [&]() -> int {
                                  ++calls;
                                  throw std::logic_error("bug");
                                }),
                  std::logic_error);
  CHECK(calls == 1);
}

TEST_CASE("retry_should_abort honours a custom abort list") {
  retry_policy const policy{ .abort_on = { fetch_error_kind::MALFORMED_SPEC } };
  CHECK(retry_should_abort(policy, fetch_error_kind::MALFORMED_SPEC));
  CHECK_FALSE(retry_should_abort(policy, fetch_error_kind::AUTHENTICATION_REQUIRED));
  CHECK(retry_should_abort(policy, fetch_error_kind::TLS_UNAVAILABLE));
}

}  // namespace gemfetch
