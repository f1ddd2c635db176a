#ifndef BIG_FACTORIAL_NUMERIC_TRAITS_HPP
#define BIG_FACTORIAL_NUMERIC_TRAITS_HPP

#include <cstdint>

#include <boost/multiprecision/cpp_int.hpp>

#include <big_factorial/big_natural.hpp>

namespace big_factorial {

// What a number type has to provide to take part in a factorial:
//
//     static T identity();                         // from_u64(1)
//     static T from_u64(uint64_t x);               // every operand
//     static T multiply(const T & a, const T & b); // associative and commutative, identity() is the identity
//
// The reduction folds partial products in whatever order the workers finish,
// so a type whose multiplication is order sensitive gives wrong results.
// Values are moved between threads, so T must not share mutable state between copies.
//
// A type without a specialisation below does not compile.
template <typename T>
struct numeric_traits;

template <typename T>
T numeric_identity(){
    return numeric_traits<T>::identity();
}

// fixed width types wrap on overflow, picking one that is wide enough is up to the caller

template <>
struct numeric_traits<uint64_t> {

    static uint64_t identity(){
        return from_u64(1);
    }

    static uint64_t from_u64(uint64_t x){
        return x;
    }

    static uint64_t multiply(const uint64_t & a, const uint64_t & b){
        return a * b;
    }

};

template <>
struct numeric_traits<unsigned __int128> {

    static unsigned __int128 identity(){
        return from_u64(1);
    }

    static unsigned __int128 from_u64(uint64_t x){
        return static_cast<unsigned __int128>(x);
    }

    static unsigned __int128 multiply(const unsigned __int128 & a, const unsigned __int128 & b){
        return a * b;
    }

};

// arbitrary precision

template <>
struct numeric_traits<boost::multiprecision::cpp_int> {

    static boost::multiprecision::cpp_int identity(){
        return from_u64(1);
    }

    static boost::multiprecision::cpp_int from_u64(uint64_t x){
        return boost::multiprecision::cpp_int(x);
    }

    static boost::multiprecision::cpp_int multiply(const boost::multiprecision::cpp_int & a, const boost::multiprecision::cpp_int & b){
        return a * b;
    }

};

template <>
struct numeric_traits<big_natural> {

    static big_natural identity(){
        return from_u64(1);
    }

    static big_natural from_u64(uint64_t x){
        return big_natural(x);
    }

    static big_natural multiply(const big_natural & a, const big_natural & b){
        return a * b;
    }

};

}

#endif
