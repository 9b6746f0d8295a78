#include <algorithm>
#include <array>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <census/census.hpp>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <future>
#include <optional>
#include <set>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

using namespace Census;

struct Gadget {
    bool power;
    std::optional<std::strong_ordering> mode;
    CENSUS_FIELDS(power, mode)

    bool operator==(const Gadget&) const = default;
};

namespace {

template <typename T>
std::size_t CountDuplicates(const std::vector<T>& values) {
    std::size_t duplicates = 0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        for (std::size_t j = i + 1; j < values.size(); ++j) {
            if (values[i] == values[j]) {
                ++duplicates;
            }
        }
    }
    return duplicates;
}

template <typename T>
bool Contains(const std::vector<T>& values, const T& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

TEMPLATE_TEST_CASE("Enumeration Laws", "[laws]", bool, uint8_t,
                   std::partial_ordering, std::optional<bool>,
                   (std::pair<bool, uint8_t>),
                   (std::variant<bool, std::partial_ordering>),
                   (std::tuple<bool, std::weak_ordering, bool>),
                   (std::array<std::optional<bool>, 3>), std::set<bool>,
                   std::set<std::future_status>, Gadget) {
    const auto values = Enumerate<TestType>();

    SECTION("Size matches cardinality") {
        REQUIRE(Natural{values.size()} == Cardinality<TestType>());
    }

    SECTION("No duplicates") { REQUIRE(CountDuplicates(values) == 0); }

    SECTION("Same result on every call") {
        REQUIRE(Enumerate<TestType>() == values);
    }
}

TEST_CASE("Enumeration Is Complete", "[laws]") {
    SECTION("uint8_t") {
        const auto values = Enumerate<uint8_t>();
        for (unsigned i = 0; i <= 255; ++i) {
            REQUIRE(Contains(values, static_cast<uint8_t>(i)));
        }
    }

    SECTION("Product") {
        const auto values = Enumerate<std::pair<bool, uint8_t>>();
        for (bool flag : {false, true}) {
            for (unsigned i = 0; i <= 255; ++i) {
                REQUIRE(Contains(values, std::pair<bool, uint8_t>{
                                             flag, static_cast<uint8_t>(i)}));
            }
        }
    }

    SECTION("Sum") {
        using V = std::variant<bool, std::partial_ordering>;
        const auto values = Enumerate<V>();
        REQUIRE(Contains(values, V{true}));
        REQUIRE(Contains(values, V{std::partial_ordering::unordered}));
        REQUIRE(Contains(values, V{std::partial_ordering::equivalent}));
    }

    SECTION("Declared fields") {
        const auto values = Enumerate<Gadget>();
        REQUIRE(Contains(values, Gadget{true, std::nullopt}));
        REQUIRE(Contains(values, Gadget{false, std::strong_ordering::greater}));
    }

    SECTION("Power set") {
        using S = std::set<std::future_status>;
        const auto values = Enumerate<S>();
        REQUIRE(Contains(values, S{}));
        REQUIRE(Contains(values, S{std::future_status::ready,
                                   std::future_status::deferred}));
    }
}
