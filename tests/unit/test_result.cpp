#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace vellum;

TEST_CASE("Result::ok creates a success result", "[unit][result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries kind, message and code", "[unit][result]") {
    auto result = Result<int>::err(Error{ErrorKind::Rejected, "refused", 403});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().is(ErrorKind::Rejected));
    REQUIRE(result.unwrap_err().message == "refused");
    REQUIRE(result.unwrap_err().code == 403);
    REQUIRE(result.unwrap_err().describe() == "rejected: refused");
}

TEST_CASE("Error without a kind is Internal", "[unit][result]") {
    const Error error{"boom"};
    REQUIRE(error.kind == ErrorKind::Internal);
    REQUIRE(error.code == 0);
}

TEST_CASE("Result::unwrap throws on error with the description", "[unit][result]") {
    auto result = Result<int>::err(Error{ErrorKind::Storage, "disk full"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
    try {
        (void)result.unwrap();
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()).find("storage: disk full") != std::string::npos);
    }
}

TEST_CASE("Result::unwrap_err throws on success", "[unit][result]") {
    auto result = Result<int>::ok(1);
    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[unit][result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value and propagates error", "[unit][result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(mapped.unwrap() == 42);

    auto failed = Result<int>::err(Error{ErrorKind::Format, "bad"}).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().is(ErrorKind::Format));
}

TEST_CASE("Result::and_then chains and short-circuits", "[unit][result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{ErrorKind::InvalidArgument, "division by zero"});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().message == "division by zero");
    REQUIRE(Result<int>::err(Error{"initial"}).and_then(divide).unwrap_err().message == "initial");
}

TEST_CASE("Result works when value and error types coincide", "[unit][result]") {
    auto ok = Result<std::string, std::string>::ok("value");
    auto err = Result<std::string, std::string>::err("error");

    REQUIRE(ok.is_ok());
    REQUIRE(ok.unwrap() == "value");
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err() == "error");
}

TEST_CASE("Result<void> works correctly", "[unit][result]") {
    auto ok_result = Status::ok();
    auto err_result = Status::err(Error{ErrorKind::Busy, "running"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE(err_result.unwrap_err().is(ErrorKind::Busy));

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());

    int calls = 0;
    auto chained = ok_result.and_then([&] { ++calls; return Status::ok(); });
    auto skipped = err_result.and_then([&] { ++calls; return Status::ok(); });
    REQUIRE(chained.is_ok());
    REQUIRE(skipped.is_err());
    REQUIRE(calls == 1);
}

TEST_CASE("Result chaining works with different types", "[unit][result]") {
    auto result = Result<int>::ok(5)
        .map([](int x) { return std::to_string(x); })
        .map([](const std::string& s) { return s + " notes"; });

    REQUIRE(result.unwrap() == "5 notes");
}
