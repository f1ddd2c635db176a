#include <big_factorial/cli.hpp>

#include <chrono>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

using namespace big_factorial;
using namespace std::chrono_literals;

namespace {

std::optional<std::string> parse(const std::vector<std::string> & args, cli_options & options){
    options = cli_options{};
    return parse_args(args, options);
}

}

TEST_CASE("OnlyNumber") {
    cli_options options;
    REQUIRE(!parse({"100"}, options).has_value());
    REQUIRE(options.x == 100);
    REQUIRE(options.reducer.concurrency == 1);
    REQUIRE(options.reducer.window_size == WINDOW_SIZE_DEFAULT);
    REQUIRE(!options.full_output);
    REQUIRE(!options.sequential);
    REQUIRE(options.backend == number_backend::gmp);
}

TEST_CASE("AllOptions") {
    cli_options options;
    REQUIRE(!parse({"-n", "8", "--full-output", "1000000", "--window-size", "500", "--timeout-ms", "250", "--max-redispatches", "5", "--backend", "boost", "--sequential", "-v"}, options).has_value());
    REQUIRE(options.x == 1'000'000);
    REQUIRE(options.reducer.concurrency == 8);
    REQUIRE(options.full_output);
    REQUIRE(options.reducer.window_size == 500);
    REQUIRE(options.reducer.window_timeout == 250ms);
    REQUIRE(options.reducer.max_redispatches == 5);
    REQUIRE(options.backend == number_backend::boost);
    REQUIRE(options.sequential);
    REQUIRE(options.reducer.verbose);
}

TEST_CASE("InlineValues") {
    cli_options options;
    REQUIRE(!parse({"--num-threads=4", "--backend=gmp", "42", "-f"}, options).has_value());
    REQUIRE(options.reducer.concurrency == 4);
    REQUIRE(options.backend == number_backend::gmp);
    REQUIRE(options.x == 42);
    REQUIRE(options.full_output);
}

TEST_CASE("LargestNumber") {
    cli_options options;
    REQUIRE(!parse({"18446744073709551615", "-n", "255"}, options).has_value());
    REQUIRE(options.x == UINT64_MAX);
    REQUIRE(options.reducer.concurrency == 255);
}

TEST_CASE("HelpAndVersionNeedNoNumber") {
    cli_options options;

    REQUIRE(!parse({"--help"}, options).has_value());
    REQUIRE(options.show_help);

    REQUIRE(!parse({"-V"}, options).has_value());
    REQUIRE(options.show_version);
}

TEST_CASE("BadArguments") {
    cli_options options;

    REQUIRE(parse({}, options).has_value());
    REQUIRE(parse({"abc"}, options).has_value());
    REQUIRE(parse({"-5"}, options).has_value());
    REQUIRE(parse({"12x"}, options).has_value());
    REQUIRE(parse({"18446744073709551616"}, options).has_value());
    REQUIRE(parse({"10", "20"}, options).has_value());
    REQUIRE(parse({"10", "-n"}, options).has_value());
    REQUIRE(parse({"10", "-n", "256"}, options).has_value());
    REQUIRE(parse({"10", "--threads", "2"}, options).has_value());
    REQUIRE(parse({"10", "--backend", "python"}, options).has_value());
    REQUIRE(parse({"10", "--window-size", ""}, options).has_value());
}

TEST_CASE("ZeroThreadsLeftToConfigCheck") {
    cli_options options;
    REQUIRE(!parse({"10", "-n", "0"}, options).has_value());
    REQUIRE(options.reducer.concurrency == 0);
    REQUIRE(check_config(options.reducer).has_value());
}

TEST_CASE("UsageMentionsOptions") {
    std::string text = usage("big-factorial");
    REQUIRE(text.find("Usage: big-factorial") == 0);
    REQUIRE(text.find("--num-threads") != std::string::npos);
    REQUIRE(text.find("--full-output") != std::string::npos);
}
