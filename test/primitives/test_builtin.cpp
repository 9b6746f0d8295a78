#include <algorithm>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <census/census.hpp>
#include <charconv>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <future>
#include <limits>
#include <locale>
#include <vector>

using namespace Census;

TEST_CASE("Builtin bool", "[builtin]") {
    REQUIRE(Enumerate<bool>() == std::vector<bool>{false, true});
    REQUIRE(Cardinality<bool>() == 2);
}

// int8_t and uint8_t are signed char and unsigned char.
TEMPLATE_TEST_CASE("Builtin Narrow Integers", "[builtin]", char, signed char,
                   unsigned char, char8_t) {
    auto values = Enumerate<TestType>();
    REQUIRE(values.size() == 256);
    REQUIRE(values.front() == std::numeric_limits<TestType>::min());
    REQUIRE(values.back() == std::numeric_limits<TestType>::max());
    REQUIRE(Cardinality<TestType>() == 256);
}

TEMPLATE_TEST_CASE("Builtin 16-bit Integers", "[builtin]", int16_t, uint16_t,
                   char16_t) {
    auto values = Enumerate<TestType>();
    REQUIRE(values.size() == 65536);
    REQUIRE(values.front() == std::numeric_limits<TestType>::min());
    REQUIRE(values.back() == std::numeric_limits<TestType>::max());
    REQUIRE(Cardinality<TestType>() == 65536);
}

TEST_CASE("Builtin std::byte", "[builtin]") {
    auto values = Enumerate<std::byte>();
    REQUIRE(values.size() == 256);
    REQUIRE(values.front() == std::byte{0x00});
    REQUIRE(values.back() == std::byte{0xFF});
    REQUIRE(Cardinality<std::byte>() == 256);
}

TEMPLATE_TEST_CASE("Builtin Wide Integers Are Large", "[builtin][large]",
                   int32_t, uint32_t, char32_t) {
    REQUIRE(Cardinality<TestType>() == Natural::Pow2(32));
}

TEMPLATE_TEST_CASE("Builtin 64-bit Integers Are Large", "[builtin][large]",
                   int64_t, uint64_t) {
    REQUIRE(Cardinality<TestType>() == Natural::Pow2(64));
}

TEST_CASE("Builtin Comparison Categories", "[builtin]") {
    REQUIRE(Enumerate<std::strong_ordering>() ==
            std::vector<std::strong_ordering>{std::strong_ordering::less,
                                              std::strong_ordering::equal,
                                              std::strong_ordering::greater});
    REQUIRE(Cardinality<std::strong_ordering>() == 3);
    REQUIRE(Cardinality<std::weak_ordering>() == 3);
    REQUIRE(Cardinality<std::partial_ordering>() == 4);
    REQUIRE(Enumerate<std::partial_ordering>().back() ==
            std::partial_ordering::unordered);
}

TEST_CASE("Builtin Bitmask Combinations", "[builtin]") {
    // The default policy of std::async is a valid std::launch value.
    const auto policies = Enumerate<std::launch>();
    REQUIRE(policies.size() == 3);
    REQUIRE(std::find(policies.begin(), policies.end(),
                      std::launch::async | std::launch::deferred) !=
            policies.end());

    // Only the named formats are listed.
    const auto formats = Enumerate<std::chars_format>();
    REQUIRE(std::find(formats.begin(), formats.end(),
                      std::chars_format::fixed | std::chars_format::hex) ==
            formats.end());
}

TEST_CASE("Builtin Standard Enums", "[builtin]") {
    SECTION("Contiguous") {
        REQUIRE(Enumerate<std::float_round_style>() ==
                std::vector<std::float_round_style>{
                    std::round_indeterminate, std::round_toward_zero,
                    std::round_to_nearest, std::round_toward_infinity,
                    std::round_toward_neg_infinity});
        REQUIRE(Cardinality<std::codecvt_base::result>() == 4);
    }

    SECTION("Literal") {
        REQUIRE(Cardinality<std::nullptr_t>() == 1);
        REQUIRE(Cardinality<std::io_errc>() == 1);
        REQUIRE(Cardinality<std::future_errc>() == 4);
        REQUIRE(Cardinality<std::future_status>() == 3);
        REQUIRE(Cardinality<std::cv_status>() == 2);
        REQUIRE(Cardinality<std::launch>() == 3);
        REQUIRE(Cardinality<std::memory_order>() == 6);
        REQUIRE(Cardinality<std::ios_base::seekdir>() == 3);
        REQUIRE(Cardinality<std::chars_format>() == 4);
        REQUIRE(Enumerate<std::chars_format>() ==
                std::vector<std::chars_format>{
                    std::chars_format::scientific, std::chars_format::fixed,
                    std::chars_format::hex, std::chars_format::general});
    }
}

static_assert(Enumerable<bool>);
static_assert(Enumerable<char>);
static_assert(Enumerable<uint16_t>);
static_assert(Enumerable<std::byte>);
static_assert(Enumerable<std::strong_ordering>);
static_assert(Enumerable<std::memory_order>);

static_assert(TooLarge<int>);
static_assert(TooLarge<unsigned long long>);
static_assert(TooLarge<char32_t>);

// No instance for floating point: NaN is not equal to itself.
static_assert(!Countable<float>);
static_assert(!Countable<double>);
