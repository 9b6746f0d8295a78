#pragma once

#include <census/core/census_natural.hpp>
#include <census/primitives/census_primitive.hpp>
#include <iterator>
#include <set>
#include <stop_token>
#include <vector>

namespace Census {

/// @cond INTERNAL
namespace detail {

/**
 * @brief Appends `current` extended by every subset of [first, last), in
 * lexicographic order.
 */
template <typename Set, typename It>
void CollectSubsets(It first, It last, Set& current, std::vector<Set>& out,
                    const std::stop_token& token) {
    out.push_back(current);
    for (auto it = first; it != last; ++it) {
        if (token.stop_requested()) {
            return;
        }
        // Elements arrive in increasing order, so they always go at the end.
        auto inserted = current.insert(current.end(), *it);
        CollectSubsets(std::next(it), last, current, out, token);
        current.erase(inserted);
    }
}

}  // namespace detail
/// @endcond

/**
 * @brief The power set of an Enumerable element type.
 *
 * Subsets are produced in the order of `std::set<std::set<T>>`, that is
 * lexicographically under Compare: for bool this is
 * `{}, {false}, {false, true}, {true}`.
 *
 * The cardinality is `2^Cardinality<T>()` and is computed without
 * enumerating, so it is cheap even when the power set is not.
 *
 * Compare must be a strict total order on the values of T: no two distinct
 * values may compare equivalent. Otherwise the universe loses elements and
 * the enumeration is shorter than the cardinality.
 */
template <Enumerable T, typename Compare, typename Allocator>
struct Traits<std::set<T, Compare, Allocator>> {
    using Set = std::set<T, Compare, Allocator>;

    [[nodiscard]] static Natural Cardinality() {
        return Natural::Pow2(Traits<T>::Cardinality());
    }

    [[nodiscard]] static std::vector<Set> Enumerate(
        std::stop_token token = {}) {
        const auto elements = Traits<T>::Enumerate();
        const Set universe(elements.begin(), elements.end());

        std::vector<Set> subsets;
        Set current;
        detail::CollectSubsets(universe.begin(), universe.end(), current,
                               subsets, token);
        return subsets;
    }
};

}  // namespace Census
