#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace studysync;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err creates an error result", "[result]") {
    auto result = Result<int>::err(Error{"something went wrong", 1});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "something went wrong");
    REQUIRE(result.unwrap_err().code == 1);
    REQUIRE(result.unwrap_err().kind == ErrorKind::Unknown);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    REQUIRE(Result<int>::ok(42).value_or(0) == 42);
    REQUIRE(Result<int>::err(Error{"error"}).value_or(0) == 0);
}

TEST_CASE("Result::map and and_then", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{"division by zero"});
        return Result<int>::ok(100 / x);
    };

    SECTION("map transforms the value") {
        auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });
        REQUIRE(mapped.unwrap() == 42);
    }

    SECTION("and_then chains") {
        REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
        REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().message == "division by zero");
    }

    SECTION("errors short-circuit") {
        auto result = Result<int>::err(Error{"initial error"}).and_then(divide);
        REQUIRE(result.unwrap_err().message == "initial error");
    }
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Error classification from HTTP status", "[result][errors]") {
    REQUIRE(Error::from_http_status(401, "x").kind == ErrorKind::Auth);
    REQUIRE(Error::from_http_status(403, "x").kind == ErrorKind::Auth);
    REQUIRE(Error::from_http_status(408, "x").kind == ErrorKind::Network);
    REQUIRE(Error::from_http_status(429, "x").kind == ErrorKind::Network);
    REQUIRE(Error::from_http_status(400, "x").kind == ErrorKind::Validation);
    REQUIRE(Error::from_http_status(409, "x").kind == ErrorKind::Validation);
    REQUIRE(Error::from_http_status(500, "x").kind == ErrorKind::Server);
    REQUIRE(Error::from_http_status(503, "x").code == 503);
}

TEST_CASE("Retryability follows the error kind", "[result][errors]") {
    REQUIRE(is_retryable(Error::network("timeout")));
    REQUIRE(is_retryable(Error::from_http_status(502, "bad gateway")));
    REQUIRE(is_retryable(Error{"mystery"}));
    REQUIRE(is_retryable(Error::database("locked")));
    REQUIRE_FALSE(is_retryable(Error::auth("expired")));
    REQUIRE_FALSE(is_retryable(Error::validation("bad payload")));
}
