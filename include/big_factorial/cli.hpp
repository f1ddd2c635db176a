#ifndef BIG_FACTORIAL_CLI_HPP
#define BIG_FACTORIAL_CLI_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <big_factorial/config.hpp>

namespace big_factorial {

enum class number_backend {
    gmp,
    boost,
};

struct cli_options {
    uint64_t x = 0;
    reducer_config reducer = {};
    bool full_output = false;
    bool sequential = false;
    number_backend backend = number_backend::gmp;
    bool show_help = false;
    bool show_version = false;
};

// `args` does not include the program name; returns a description of what is wrong, if anything
std::optional<std::string> parse_args(const std::vector<std::string> & args, cli_options & options);

std::string usage(const std::string & program);

}

#endif
