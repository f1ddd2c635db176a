#include <big_factorial/config.hpp>

#include <chrono>

#include <catch2/catch.hpp>

using namespace big_factorial;
using namespace std::chrono_literals;

TEST_CASE("DefaultConfigIsValid") {
    reducer_config config;
    REQUIRE(config.window_size == 10'000);
    REQUIRE(config.concurrency == 1);
    REQUIRE(config.max_redispatches == MAX_REDISPATCHES_DEFAULT);
    REQUIRE(!config.verbose);
    REQUIRE(!check_config(config).has_value());
}

TEST_CASE("ZeroThreadsRejected") {
    reducer_config config;
    config.concurrency = 0;

    auto problem = check_config(config);
    REQUIRE(problem.has_value());
    REQUIRE(problem->find("threads") != std::string::npos);
}

TEST_CASE("TooManyThreadsRejected") {
    reducer_config config;

    config.concurrency = CONCURRENCY_MAX;
    REQUIRE(!check_config(config).has_value());

    config.concurrency = CONCURRENCY_MAX + 1;
    REQUIRE(check_config(config).has_value());
}

TEST_CASE("ZeroWindowRejected") {
    reducer_config config;
    config.window_size = 0;
    REQUIRE(check_config(config).has_value());
}

TEST_CASE("NonPositiveTimeoutRejected") {
    reducer_config config;

    config.window_timeout = 0ms;
    REQUIRE(check_config(config).has_value());

    config.window_timeout = -5ms;
    REQUIRE(check_config(config).has_value());

    config.window_timeout = 1ms;
    REQUIRE(!check_config(config).has_value());
}
