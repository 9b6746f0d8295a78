#pragma once

#include <census/census_detail.hpp>
#include <census/containers/census_set.hpp>
#include <census/core/census_natural.hpp>
#include <census/core/census_types.hpp>
#include <census/derive/census_generic.hpp>
#include <census/primitives/census_builtin.hpp>
#include <census/primitives/census_primitive.hpp>
#include <census/shapes/census_engine.hpp>
#include <census/shapes/census_shape.hpp>
#include <chrono>
#include <expected>
#include <optional>
#include <vector>

/**
 * @brief The public API for Census.
 *
 * This section contains the interfaces for enumerating every value of a
 * finite type, and transitively provides the Traits, strategies, shapes and
 * Generic specializations needed to make a type Enumerable.
 *
 * @section top_level_apis Top-level APIs
 *
 * - @b Enumerate: Every value of T, in structural order.
 * - @b Cardinality: The number of values of T, without enumerating.
 * - @b EnumerateBelow: Enumerates only when the cardinality is below a
 *   ceiling.
 * - @b EnumerateWithDeadline: Enumerates only when materialization finishes
 *   before a deadline.
 */

namespace Census {

using detail::BoundedEnumeration;
using shapes::Never;

/**
 * @brief Enumerates every value of T.
 *
 * The result is duplicate free, contains every value of T, has exactly
 * Cardinality<T>() elements, and is identical across calls. For a derived
 * type, alternatives appear in declaration order and the last field varies
 * fastest.
 *
 * @tparam T An Enumerable type. TooLarge types are rejected at compile time.
 * @return A freshly allocated vector owned by the caller.
 */
template <Enumerable T>
[[nodiscard]] std::vector<T> Enumerate() {
    return Traits<T>::Enumerate();
}

/**
 * @brief Counts the values of T.
 *
 * Computed from closed forms over the type's structure, so it is cheap even
 * for TooLarge types.
 *
 * @tparam T A Countable type.
 * @return The cardinality as an unbounded Natural.
 */
template <Countable T>
[[nodiscard]] Natural Cardinality() {
    return Traits<T>::Cardinality();
}

/**
 * @brief Enumerates T only if its cardinality is strictly below `ceiling`.
 *
 * @tparam T An Enumerable type.
 * @param ceiling The exclusive upper bound on the cardinality.
 * @return The cardinality, together with either the enumeration or
 * ErrorCode::SizeRejected. Nothing is materialized on rejection.
 */
template <Enumerable T>
[[nodiscard]] BoundedEnumeration<T> EnumerateBelow(const Natural& ceiling) {
    return detail::EnumerateBelow<T>(ceiling);
}

/**
 * @brief Enumerates T only if materialization finishes within
 * `max_duration`.
 *
 * The work runs on a separate thread. On timeout the thread is asked to stop
 * and abandoned; the partial work is discarded. A budget at or beyond the
 * range of steady_clock::duration waits without a deadline.
 *
 * @tparam T An Enumerable type.
 * @param max_duration The wall-clock budget.
 * @return The enumeration, or ErrorCode::DeadlineExceeded.
 */
template <Enumerable T, typename Rep, typename Period>
[[nodiscard]] std::expected<std::vector<T>, Error> EnumerateWithDeadline(
    std::chrono::duration<Rep, Period> max_duration) {
    using Budget = std::chrono::steady_clock::duration;
    using Wide = std::chrono::duration<long double, Budget::period>;
    if (Wide{max_duration} >= Wide{Budget::max()}) {
        return detail::EnumerateWithDeadline<T>(std::nullopt);
    }
    return detail::EnumerateWithDeadline<T>(
        std::chrono::duration_cast<Budget>(max_duration));
}

}  // namespace Census
