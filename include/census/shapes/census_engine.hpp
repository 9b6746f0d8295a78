#pragma once

#include <census/core/census_natural.hpp>
#include <census/primitives/census_primitive.hpp>
#include <census/shapes/census_shape.hpp>
#include <concepts>
#include <stop_token>
#include <utility>
#include <variant>
#include <vector>

namespace Census::shapes {

/**
 * @brief Derives enumeration and cardinality for a shape.
 *
 * Each specialization provides:
 * - `static Natural Cardinality()`, from the cardinalities of the parts only.
 * - `static std::vector<S::Value> Enumerate(std::stop_token)`, present only
 *   when every leaf is Enumerable.
 *
 * The enumeration order is depth first: the left alternative of a Sum
 * precedes the right, and the right field of a Product varies fastest.
 *
 * Enumerate checks the stop token between elements and returns early with
 * a partial result once stop is requested. The partial result is meant to be
 * discarded.
 */
template <Shape S>
struct Engine;

/**
 * @brief Concept for shapes whose every leaf is Enumerable.
 */
template <typename S>
concept EnumerableShape = requires(std::stop_token token) {
    {
        Engine<S>::Enumerate(token)
    } -> std::same_as<std::vector<typename S::Value>>;
};

/**
 * @brief Concept for shapes whose every leaf is Countable.
 */
template <typename S>
concept CountableShape = requires {
    { Engine<S>::Cardinality() } -> std::same_as<Natural>;
};

/**
 * @brief Enumerates T, passing the stop token on when T's Traits accept one.
 *
 * Derived types accept the token, primitives do not.
 */
template <Enumerable T>
[[nodiscard]] std::vector<T> EnumerateLeaf(std::stop_token token) {
    if constexpr (requires { Traits<T>::Enumerate(token); }) {
        return Traits<T>::Enumerate(std::move(token));
    } else {
        return Traits<T>::Enumerate();
    }
}

template <>
struct Engine<Unit> {
    [[nodiscard]] static Natural Cardinality() { return Natural{1}; }

    [[nodiscard]] static std::vector<std::monostate> Enumerate(
        std::stop_token /*token*/) {
        return {std::monostate{}};
    }
};

template <>
struct Engine<Void> {
    [[nodiscard]] static Natural Cardinality() { return Natural{}; }

    [[nodiscard]] static std::vector<Never> Enumerate(
        std::stop_token /*token*/) {
        return {};
    }
};

template <typename T>
struct Engine<Leaf<T>> {
    [[nodiscard]] static Natural Cardinality()
        requires Countable<T>
    {
        return Traits<T>::Cardinality();
    }

    [[nodiscard]] static std::vector<T> Enumerate(std::stop_token token)
        requires Enumerable<T>
    {
        return EnumerateLeaf<T>(std::move(token));
    }
};

template <typename L, typename R>
struct Engine<Product<L, R>> {
    using Value = typename Product<L, R>::Value;

    [[nodiscard]] static Natural Cardinality()
        requires CountableShape<L> && CountableShape<R>
    {
        return Engine<L>::Cardinality() * Engine<R>::Cardinality();
    }

    [[nodiscard]] static std::vector<Value> Enumerate(std::stop_token token)
        requires EnumerableShape<L> && EnumerableShape<R>
    {
        const auto lefts = Engine<L>::Enumerate(token);
        const auto rights = Engine<R>::Enumerate(token);

        std::vector<Value> values;
        values.reserve(lefts.size() * rights.size());
        for (const auto& left : lefts) {
            for (const auto& right : rights) {
                if (token.stop_requested()) {
                    return values;
                }
                values.emplace_back(left, right);
            }
        }
        return values;
    }
};

template <typename L, typename R>
struct Engine<Sum<L, R>> {
    using Value = typename Sum<L, R>::Value;

    [[nodiscard]] static Natural Cardinality()
        requires CountableShape<L> && CountableShape<R>
    {
        return Engine<L>::Cardinality() + Engine<R>::Cardinality();
    }

    [[nodiscard]] static std::vector<Value> Enumerate(std::stop_token token)
        requires EnumerableShape<L> && EnumerableShape<R>
    {
        auto lefts = Engine<L>::Enumerate(token);
        auto rights = Engine<R>::Enumerate(token);

        std::vector<Value> values;
        values.reserve(lefts.size() + rights.size());
        for (auto&& left : lefts) {
            if (token.stop_requested()) {
                return values;
            }
            values.emplace_back(std::in_place_index<0>, std::move(left));
        }
        for (auto&& right : rights) {
            if (token.stop_requested()) {
                return values;
            }
            values.emplace_back(std::in_place_index<1>, std::move(right));
        }
        return values;
    }
};

template <typename Label, typename S>
struct Engine<Labeled<Label, S>> {
    [[nodiscard]] static Natural Cardinality()
        requires CountableShape<S>
    {
        return Engine<S>::Cardinality();
    }

    [[nodiscard]] static auto Enumerate(std::stop_token token)
        requires EnumerableShape<S>
    {
        return Engine<S>::Enumerate(std::move(token));
    }
};

}  // namespace Census::shapes
