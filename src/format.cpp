#include <big_factorial/format.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <system_error>

#include <big_factorial/errors.hpp>

using namespace std;
using boost::multiprecision::cpp_int;

namespace big_factorial {

// a double holds 53 significant bits
constexpr unsigned MANTISSA_BITS = 52;

sci_notation sci_mantissa_and_exponent(const big_natural & value){
    return value.sci_mantissa_and_exponent();
}

sci_notation sci_mantissa_and_exponent(const cpp_int & value){

    BIG_FACTORIAL_ASSERT(value >= 0);

    if(value == 0){
        return {0.0, 0};
    }

    unsigned top_bit = boost::multiprecision::msb(value);

    // keep the top 53 bits, the shift drops the rest (rounds toward zero like gmp does)
    cpp_int top = value;
    unsigned shift = 0;
    if(top_bit > MANTISSA_BITS){
        shift = top_bit - MANTISSA_BITS;
        top >>= shift;
    }

    double mantissa = ldexp(top.convert_to<double>(), -static_cast<int>(top_bit - shift));

    return {mantissa, static_cast<int64_t>(top_bit)};

}

string format_full(const big_natural & value){
    return value.to_string();
}

string format_full(const cpp_int & value){
    return value.str();
}

string format_sci(const sci_notation & sci){

    array<char, 64> buffer = {};

    to_chars_result res = to_chars(buffer.data(), buffer.data() + buffer.size(), sci.mantissa);
    BIG_FACTORIAL_ASSERT(res.ec == errc());

    return string(buffer.data(), res.ptr) + "*2^" + to_string(sci.exponent);

}

string format_result(uint64_t n, const string & rendered){
    return to_string(n) + "! = " + rendered;
}

}
