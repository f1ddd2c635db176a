#ifndef BIG_FACTORIAL_FORMAT_HPP
#define BIG_FACTORIAL_FORMAT_HPP

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

#include <big_factorial/big_natural.hpp>

namespace big_factorial {

sci_notation sci_mantissa_and_exponent(const big_natural & value);
sci_notation sci_mantissa_and_exponent(const boost::multiprecision::cpp_int & value);

// all decimal digits
std::string format_full(const big_natural & value);
std::string format_full(const boost::multiprecision::cpp_int & value);

// `<mantissa>*2^<exponent>`, mantissa in [1, 2) printed as short as it round trips
std::string format_sci(const sci_notation & sci);

// `<n>! = <value>`
std::string format_result(uint64_t n, const std::string & rendered);

}

#endif
