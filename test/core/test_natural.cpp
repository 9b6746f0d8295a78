#include <catch2/catch_test_macros.hpp>
#include <census/core/census_natural.hpp>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

using Census::Natural;

TEST_CASE("Natural Construction", "[natural]") {
    REQUIRE(Natural{}.is_zero());
    REQUIRE(Natural{0} == Natural{});
    REQUIRE_FALSE(Natural{1}.is_zero());

    REQUIRE(Natural{42}.to_uint64() == uint64_t{42});
    REQUIRE(Natural{}.to_string() == "0");
    REQUIRE(Natural{42}.to_string() == "42");

    const Natural max64{std::numeric_limits<uint64_t>::max()};
    REQUIRE(max64.to_uint64() == std::numeric_limits<uint64_t>::max());
    REQUIRE(max64.to_string() == "18446744073709551615");
}

TEST_CASE("Natural From Signed Integers", "[natural]") {
    REQUIRE(Natural{int64_t{7}} == 7);
    REQUIRE(Natural{std::numeric_limits<int64_t>::max()}.to_uint64() ==
            uint64_t{std::numeric_limits<int64_t>::max()});

    // Negative values are rejected instead of wrapping modulo 2^64.
    REQUIRE_THROWS_AS(Natural{-1}, std::out_of_range);
    REQUIRE_THROWS_AS(Natural{std::numeric_limits<int64_t>::min()},
                      std::out_of_range);
}

TEST_CASE("Natural Addition", "[natural]") {
    SECTION("Small") { REQUIRE(Natural{2} + Natural{3} == 5); }

    SECTION("Carry past 64 bits") {
        const Natural max64{std::numeric_limits<uint64_t>::max()};
        const Natural sum = max64 + 1;
        REQUIRE(sum.to_string() == "18446744073709551616");
        REQUIRE_FALSE(sum.to_uint64().has_value());
        REQUIRE(sum == Natural::Pow2(64));
    }

    SECTION("Self") {
        Natural n{1'000'000'000};
        n += n;
        REQUIRE(n == 2'000'000'000);
    }

    SECTION("Zero is the identity") {
        REQUIRE(Natural{} + Natural{7} == 7);
        REQUIRE(Natural{7} + Natural{} == 7);
    }
}

TEST_CASE("Natural Multiplication", "[natural]") {
    const Natural max64{std::numeric_limits<uint64_t>::max()};

    REQUIRE(Natural{6} * Natural{7} == 42);
    REQUIRE(Natural{} * max64 == 0);
    REQUIRE(max64 * Natural{} == 0);
    REQUIRE(Natural{uint64_t{1} << 32} * Natural{uint64_t{1} << 32} ==
            Natural::Pow2(64));
    REQUIRE((max64 * max64).to_string() ==
            "340282366920938463426481119284349108225");

    Natural product{3};
    product *= 5;
    REQUIRE(product == 15);
}

TEST_CASE("Natural Powers of Two", "[natural]") {
    REQUIRE(Natural::Pow2(0) == 1);
    REQUIRE(Natural::Pow2(1) == 2);
    REQUIRE(Natural::Pow2(31) == uint64_t{1} << 31);
    REQUIRE(Natural::Pow2(32) == uint64_t{1} << 32);
    REQUIRE(Natural::Pow2(100).to_string() ==
            "1267650600228229401496703205376");
    REQUIRE(Natural::Pow2(256).to_string() ==
            "115792089237316195423570985008687907853269984665640564039457584007"
            "913129639936");

    // An exponent of 2^64 would need 2^61 bytes.
    REQUIRE_THROWS_AS(Natural::Pow2(Natural::Pow2(64)), std::length_error);
}

TEST_CASE("Natural Decimal Rendering", "[natural]") {
    // Inner base-10^9 chunks must keep their leading zeros.
    REQUIRE(Natural{1'000'000'000'000'000'000}.to_string() ==
            "1000000000000000000");
    REQUIRE(Natural{1'000'000'000'000'000'007}.to_string() ==
            "1000000000000000007");

    std::ostringstream os;
    os << Natural::Pow2(64);
    REQUIRE(os.str() == "18446744073709551616");
}

TEST_CASE("Natural Ordering", "[natural]") {
    const Natural max64{std::numeric_limits<uint64_t>::max()};

    REQUIRE(Natural{5} < Natural{7});
    REQUIRE(Natural{7} > Natural{5});
    REQUIRE(Natural{} < Natural{1});
    REQUIRE(max64 < Natural::Pow2(64));
    REQUIRE(Natural::Pow2(64) > max64);
    REQUIRE(Natural::Pow2(33) > Natural::Pow2(32) + Natural::Pow2(31));
    REQUIRE(Natural{3} <= 3);
    REQUIRE(Natural{3} != 4);
}

static_assert(Natural{2} + Natural{3} == Natural{5});
static_assert(Natural{6} * Natural{7} == Natural{42});
static_assert(Natural{1} < Natural::Pow2(64));
