#ifndef BIG_FACTORIAL_RANGE_PRODUCT_HPP
#define BIG_FACTORIAL_RANGE_PRODUCT_HPP

#include <cstdint>

#include <big_factorial/numeric_traits.hpp>

namespace big_factorial {

// product of all the numbers in [from, to], 1 if the range is empty
template <typename T>
T range_product(uint64_t from, uint64_t to){

    using traits = numeric_traits<T>;

    T product = numeric_identity<T>();

    if(from > to){
        return product;
    }

    // written so that `to == UINT64_MAX` does not loop forever
    for(uint64_t x = from;; ++x){
        product = traits::multiply(product, traits::from_u64(x));
        if(x == to){
            break;
        }
    }

    return product;

}

// single threaded factorial, the reference the parallel version gets checked against
template <typename T>
T factorial(uint64_t n){
    return range_product<T>(1, n);
}

}

#endif
