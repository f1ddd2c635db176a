#ifndef BIG_FACTORIAL_BIG_NATURAL_HPP
#define BIG_FACTORIAL_BIG_NATURAL_HPP

#include <cstdint>
#include <ostream>
#include <string>

#include <gmp.h>

namespace big_factorial {

// value = mantissa * 2^exponent, with 1 <= mantissa < 2 (both 0 for a value of 0)
struct sci_notation {
    double mantissa;
    int64_t exponent;
};

// owns a gmp integer; only ever holds non-negative values
class big_natural {

public:

    big_natural();
    big_natural(uint64_t value);

    big_natural(const big_natural & other);
    big_natural(big_natural && other) noexcept;
    big_natural & operator=(const big_natural & other);
    big_natural & operator=(big_natural && other) noexcept;

    ~big_natural();

    big_natural & operator*=(const big_natural & other);

    friend big_natural operator*(const big_natural & lhs, const big_natural & rhs);

    friend bool operator==(const big_natural & lhs, const big_natural & rhs);
    friend bool operator==(const big_natural & lhs, uint64_t rhs);

    friend std::ostream & operator<<(std::ostream & os, const big_natural & value);

    std::string to_string() const;

    sci_notation sci_mantissa_and_exponent() const;

    // number of significant bits, 0 for a value of 0
    size_t bit_length() const;

    mpz_t & get();
    const mpz_t & get() const;

private:

    mpz_t value;

};

}

#endif
