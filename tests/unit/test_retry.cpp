#include <catch2/catch_test_macros.hpp>
#include "sync/retry.hpp"

#include <vector>

using namespace vellum;
using namespace vellum::sync;
using namespace std::chrono_literals;

namespace {

struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> delays;

    Sleeper sleeper() {
        return [this](std::chrono::milliseconds d) { delays.push_back(d); };
    }
};

Status unreachable() {
    return Status::err(Error{ErrorKind::ServerUnreachable, "connection refused", 0});
}

} // namespace

TEST_CASE("Backoff grows geometrically", "[unit][retry]") {
    const RetryPolicy policy;
    REQUIRE(policy.delay_after(1) == 200ms);
    REQUIRE(policy.delay_after(2) == 400ms);
    REQUIRE(policy.delay_after(3) == 800ms);

    const RetryPolicy flat{.max_attempts = 5, .initial_delay = 50ms, .multiplier = 1.0};
    REQUIRE(flat.delay_after(4) == 50ms);
}

TEST_CASE("First success makes one attempt and never sleeps", "[unit][retry]") {
    RecordingSleeper sleeper;
    int attempts = 0;
    auto result = with_retry(RetryPolicy{}, sleeper.sleeper(), [] { return Status::ok(); }, attempts);
    REQUIRE(result.is_ok());
    REQUIRE(attempts == 1);
    REQUIRE(sleeper.delays.empty());
}

TEST_CASE("Unreachable server is retried until it recovers", "[unit][retry]") {
    RecordingSleeper sleeper;
    int calls = 0;
    int attempts = 0;
    auto result = with_retry(RetryPolicy{}, sleeper.sleeper(), [&] {
        return ++calls < 3 ? unreachable() : Status::ok();
    }, attempts);

    REQUIRE(result.is_ok());
    REQUIRE(attempts == 3);
    REQUIRE(sleeper.delays == std::vector<std::chrono::milliseconds>{200ms, 400ms});
}

TEST_CASE("Exhausted retries become a Transport error", "[unit][retry]") {
    RecordingSleeper sleeper;
    int attempts = 0;
    const RetryPolicy policy{.max_attempts = 4, .initial_delay = 10ms, .multiplier = 3.0};
    auto result = with_retry(policy, sleeper.sleeper(), unreachable, attempts);

    REQUIRE(result.is_err());
    REQUIRE(attempts == 4);
    REQUIRE(result.unwrap_err().is(ErrorKind::Transport));
    REQUIRE(result.unwrap_err().message == "Gave up after 4 attempts: connection refused");
    REQUIRE(sleeper.delays == std::vector<std::chrono::milliseconds>{10ms, 30ms, 90ms});
}

TEST_CASE("Other errors are returned without retrying", "[unit][retry]") {
    RecordingSleeper sleeper;
    int attempts = 0;
    auto result = with_retry(RetryPolicy{}, sleeper.sleeper(), [] {
        return Status::err(Error{ErrorKind::Rejected, "bad request", 400});
    }, attempts);

    REQUIRE(attempts == 1);
    REQUIRE(result.unwrap_err().is(ErrorKind::Rejected));
    REQUIRE(result.unwrap_err().code == 400);
    REQUIRE(sleeper.delays.empty());
}

TEST_CASE("Policy without retries makes a single attempt", "[unit][retry]") {
    int attempts = 0;
    auto result = with_retry(RetryPolicy::none(), Sleeper{}, unreachable, attempts);
    REQUIRE(attempts == 1);
    REQUIRE(result.unwrap_err().is(ErrorKind::Transport));

    const RetryPolicy broken{.max_attempts = 0, .initial_delay = 1ms, .multiplier = 2.0};
    (void)with_retry(broken, Sleeper{}, unreachable, attempts);
    REQUIRE(attempts == 1);
}
