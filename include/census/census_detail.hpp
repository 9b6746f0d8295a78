#pragma once

#include <census/core/census_natural.hpp>
#include <census/core/census_types.hpp>
#include <census/primitives/census_primitive.hpp>
#include <census/shapes/census_engine.hpp>
#include <chrono>
#include <exception>
#include <expected>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief Internal implementation details for Census's public API.
 */
namespace Census::detail {

/**
 * @brief Result of a size-guarded enumeration.
 *
 * Carries the cardinality either way; `values` holds the enumeration when
 * the cardinality was below the ceiling, or ErrorCode::SizeRejected.
 *
 * @tparam T The enumerated type.
 */
template <typename T>
struct BoundedEnumeration {
    Natural cardinality;
    std::expected<std::vector<T>, Error> values;

    [[nodiscard]] constexpr bool accepted() const noexcept {
        return values.has_value();
    }
};

/**
 * @brief Enumerates T only when its cardinality is strictly below the
 * ceiling. The cardinality is computed first and nothing is materialized on
 * rejection.
 */
template <Enumerable T>
[[nodiscard]] BoundedEnumeration<T> EnumerateBelow(const Natural& ceiling) {
    Natural cardinality = Traits<T>::Cardinality();
    if (cardinality < ceiling) {
        auto values = Traits<T>::Enumerate();
        return {std::move(cardinality), std::move(values)};
    }
    return {std::move(cardinality), std::unexpected(Error::size_rejected())};
}

/**
 * @brief Materializes the enumeration of T on a worker thread and waits at
 * most `max_duration` for it, or without limit when `max_duration` is empty.
 *
 * On timeout the worker is asked to stop and then abandoned: it may keep
 * running briefly, its result is discarded, and the caller gets
 * ErrorCode::DeadlineExceeded. Types that accept a stop token (derived
 * types, sets) stop between elements; primitive leaves run to completion.
 *
 * Exceptions thrown by the enumeration are rethrown to the caller.
 */
template <Enumerable T>
[[nodiscard]] std::expected<std::vector<T>, Error> EnumerateWithDeadline(
    std::optional<std::chrono::steady_clock::duration> max_duration) {
    auto promise = std::make_shared<std::promise<std::vector<T>>>();
    auto result = promise->get_future();

    std::jthread worker([promise](std::stop_token token) {
        try {
            promise->set_value(shapes::EnumerateLeaf<T>(std::move(token)));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    if (!max_duration.has_value()) {
        return result.get();
    }
    if (result.wait_for(*max_duration) != std::future_status::ready) {
        worker.request_stop();
        worker.detach();
        return std::unexpected(Error::deadline_exceeded());
    }
    return result.get();
}

}  // namespace Census::detail
