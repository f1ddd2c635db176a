#ifndef BIG_FACTORIAL_CONFIG_HPP
#define BIG_FACTORIAL_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace big_factorial {

constexpr uint64_t WINDOW_SIZE_DEFAULT = 10'000;
constexpr size_t CONCURRENCY_DEFAULT = 1;
constexpr size_t CONCURRENCY_MAX = UINT8_MAX;
constexpr std::chrono::milliseconds WINDOW_TIMEOUT_DEFAULT{60'000};
constexpr unsigned MAX_REDISPATCHES_DEFAULT = 3;

struct reducer_config {

    // how many consecutive integers one worker multiplies
    uint64_t window_size = WINDOW_SIZE_DEFAULT;

    // windows allowed in flight at the same time (also the number of worker threads)
    size_t concurrency = CONCURRENCY_DEFAULT;

    // a window that has not reported back after this long gets dispatched again
    std::chrono::milliseconds window_timeout = WINDOW_TIMEOUT_DEFAULT;

    // how many times a single window may be dispatched again before we give up
    unsigned max_redispatches = MAX_REDISPATCHES_DEFAULT;

    // print progress to stdout
    bool verbose = false;

};

// returns a description of the problem, or nothing if the config can be used
std::optional<std::string> check_config(const reducer_config & config);

}

#endif
