#include <big_factorial/big_natural.hpp>

#include <climits>
#include <cmath>
#include <memory>
#include <utility>

#include <big_factorial/errors.hpp>

using namespace std;

// mpz_set_ui takes an unsigned long
static_assert(sizeof(unsigned long) * CHAR_BIT >= 64, "unsigned long needs to hold a uint64_t");

namespace big_factorial {

big_natural::big_natural() {
    mpz_init(value);
}

big_natural::big_natural(uint64_t number) {
    mpz_init_set_ui(value, number);
}

big_natural::big_natural(const big_natural & other) {
    mpz_init_set(value, other.value);
}

big_natural::big_natural(big_natural && other) noexcept {
    // leave `other` as a valid zero, gmp has no notion of a moved-from mpz_t
    mpz_init(value);
    mpz_swap(value, other.value);
}

big_natural & big_natural::operator=(const big_natural & other) {
    if(this != &other){
        mpz_set(value, other.value);
    }
    return *this;
}

big_natural & big_natural::operator=(big_natural && other) noexcept {
    mpz_swap(value, other.value);
    return *this;
}

big_natural::~big_natural() {
    mpz_clear(value);
}

big_natural & big_natural::operator*=(const big_natural & other) {
    mpz_mul(value, value, other.value);
    return *this;
}

big_natural operator*(const big_natural & lhs, const big_natural & rhs) {
    big_natural product;
    mpz_mul(product.value, lhs.value, rhs.value);
    return product;
}

bool operator==(const big_natural & lhs, const big_natural & rhs) {
    return mpz_cmp(lhs.value, rhs.value) == 0;
}

bool operator==(const big_natural & lhs, uint64_t rhs) {
    return mpz_cmp_ui(lhs.value, rhs) == 0;
}

ostream & operator<<(ostream & os, const big_natural & value) {
    return os << value.to_string();
}

string big_natural::to_string() const {

    // mpz_sizeinbase may overshoot by 1, +1 more for the terminator
    size_t buffer_size = mpz_sizeinbase(value, 10) + 2;

    unique_ptr<char[]> buffer(new char[buffer_size]);
    mpz_get_str(buffer.get(), 10, value);

    return string(buffer.get());

}

sci_notation big_natural::sci_mantissa_and_exponent() const {

    if(mpz_sgn(value) == 0){
        return {0.0, 0};
    }

    // gmp gives us `d * 2^exp` with 0.5 <= d < 1, truncated
    long exp = 0;
    double d = mpz_get_d_2exp(&exp, value);
    BIG_FACTORIAL_ASSERT(d >= 0.5 && d < 1.0);

    return {d * 2.0, static_cast<int64_t>(exp) - 1};

}

size_t big_natural::bit_length() const {

    if(mpz_sgn(value) == 0){
        return 0;
    }

    return mpz_sizeinbase(value, 2);

}

mpz_t & big_natural::get() {
    return value;
}

const mpz_t & big_natural::get() const {
    return value;
}

}
