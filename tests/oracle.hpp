#ifndef BIG_FACTORIAL_TESTS_ORACLE_HPP
#define BIG_FACTORIAL_TESTS_ORACLE_HPP

#include <algorithm>
#include <cstdint>
#include <string>

#include <gmp.h>

#include <big_factorial/big_natural.hpp>

// n! straight from gmp, independent of anything in big_factorial
inline big_factorial::big_natural reference_factorial(uint64_t n){
    big_factorial::big_natural result;
    mpz_fac_ui(result.get(), n);
    return result;
}

inline std::string u128_to_string(unsigned __int128 value){

    if(value == 0){
        return "0";
    }

    std::string digits;
    while(value > 0){
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());

    return digits;

}

#endif
