#include <big_factorial/big_natural.hpp>

#include <cstdint>
#include <sstream>
#include <utility>

#include <catch2/catch.hpp>

using namespace big_factorial;

TEST_CASE("DefaultIsZero") {
    big_natural zero;
    REQUIRE(zero == 0);
    REQUIRE(zero.to_string() == "0");
    REQUIRE(zero.bit_length() == 0);
}

TEST_CASE("FromU64") {
    big_natural max(UINT64_MAX);
    REQUIRE(max == UINT64_MAX);
    REQUIRE(max.to_string() == "18446744073709551615");
    REQUIRE(max.bit_length() == 64);
}

TEST_CASE("Multiply") {
    big_natural a(UINT64_MAX);
    big_natural b(UINT64_MAX);

    big_natural product = a * b;
    REQUIRE(product.to_string() == "340282366920938463426481119284349108225");

    a *= big_natural(2);
    REQUIRE(a.to_string() == "36893488147419103230");

    REQUIRE(big_natural(6) * big_natural(7) == big_natural(7) * big_natural(6));
    REQUIRE(big_natural(6) * big_natural(1) == 6);
}

TEST_CASE("CopyIsIndependent") {
    big_natural a(10);
    big_natural b = a;
    b *= big_natural(3);

    REQUIRE(a == 10);
    REQUIRE(b == 30);

    a = b;
    REQUIRE(a == 30);
    REQUIRE(b == 30);
}

TEST_CASE("Move") {
    big_natural a(42);
    big_natural b = std::move(a);
    REQUIRE(b == 42);
    REQUIRE(a == 0);

    big_natural c(7);
    c = std::move(b);
    REQUIRE(c == 42);
}

TEST_CASE("StreamOutput") {
    std::ostringstream out;
    out << big_natural(3628800);
    REQUIRE(out.str() == "3628800");
}
