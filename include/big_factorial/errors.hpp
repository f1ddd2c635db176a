#ifndef BIG_FACTORIAL_ERRORS_HPP
#define BIG_FACTORIAL_ERRORS_HPP

#include <cstdlib>
#include <iostream>

#ifndef BIG_FACTORIAL_COMMIT_ID
#define BIG_FACTORIAL_COMMIT_ID "UNKNOWN"
#endif

// something inside the program went wrong
#define BIG_FACTORIAL_ERR(...) { \
    std::cerr << "ERROR: "; \
    std::cerr << "commit `" << BIG_FACTORIAL_COMMIT_ID << "`, "; \
    std::cerr << "file `" << __FILE__ << "`, "; \
    std::cerr << "line " << __LINE__ << ": "; \
    std::cerr << __VA_ARGS__; \
    std::cerr << std::endl; \
    std::exit(1); \
}

#define BIG_FACTORIAL_UNREACHABLE() { \
    BIG_FACTORIAL_ERR("Unreachable code reached") \
}

#define BIG_FACTORIAL_ASSERT(condition) { \
    if(!(condition)){ \
        BIG_FACTORIAL_ERR("Assertion failed: " #condition); \
    } \
}

// used when the end user did something wrong
#define BIG_FACTORIAL_USER_ERR(...) { \
    std::cerr << "ERROR: "; \
    std::cerr << __VA_ARGS__; \
    std::cerr << std::endl; \
    std::exit(1); \
}

#define BIG_FACTORIAL_WARN(...) { \
    std::cerr << "WARNING: "; \
    std::cerr << __VA_ARGS__; \
    std::cerr << std::endl; \
}

#endif
