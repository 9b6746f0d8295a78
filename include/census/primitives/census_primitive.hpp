#pragma once

#include <algorithm>
#include <array>
#include <census/core/census_natural.hpp>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace Census {

/**
 * @brief The per-type enumeration interface.
 *
 * A specialization for T supplies:
 * - `static std::vector<T> Enumerate()`: every value of T, exactly once, in
 *   a fixed order.
 * - `static Natural Cardinality()`: the number of values, always equal to
 *   `Enumerate().size()`.
 *
 * Primitive types opt in explicitly by specializing Traits, usually by
 * inheriting one of the strategies below. Composite types get a
 * specialization from their Generic shape (see census_generic.hpp).
 *
 * The primary template is empty: a type nobody has specialized is neither
 * Countable nor Enumerable.
 */
template <typename T>
struct Traits {};

/**
 * @brief Concept for types whose cardinality is known.
 */
template <typename T>
concept Countable = requires {
    { Traits<T>::Cardinality() } -> std::same_as<Natural>;
};

/**
 * @brief Concept for types that may be enumerated.
 *
 * Types tagged with Large are Countable but never Enumerable, so passing one
 * to Enumerate fails to compile instead of hanging at runtime.
 */
template <typename T>
concept Enumerable = Countable<T> && requires {
    { Traits<T>::Enumerate() } -> std::same_as<std::vector<T>>;
};

/**
 * @brief Concept for types deliberately excluded from enumeration.
 */
template <typename T>
concept TooLarge = Countable<T> && !Enumerable<T>;

/// @cond INTERNAL
namespace detail {

template <typename T>
concept Ordinal = std::integral<T> || std::is_enum_v<T>;

template <typename T>
struct ordinal_type {
    using type = T;
};

template <typename T>
    requires std::is_enum_v<T>
struct ordinal_type<T> {
    using type = std::underlying_type_t<T>;
};

/**
 * @brief Integer position of a value. Promotes bool and narrow characters
 * to int so the position can be incremented.
 */
template <Ordinal T>
[[nodiscard]] constexpr auto ToOrdinal(T value) noexcept {
    using Raw = typename ordinal_type<T>::type;
    return +static_cast<Raw>(value);
}

template <Ordinal T, typename O>
[[nodiscard]] constexpr T FromOrdinal(O ordinal) noexcept {
    return static_cast<T>(ordinal);
}

template <typename T, std::size_t N>
[[nodiscard]] constexpr bool AllDistinct(const std::array<T, N>& values) {
    for (std::size_t i = 0; i < N; ++i) {
        for (std::size_t j = i + 1; j < N; ++j) {
            if (values[i] == values[j]) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace detail
/// @endcond

/**
 * @brief Strategy for types ordered contiguously from Min to Max.
 *
 * Enumerates by walking the ordinals from Min to Max inclusive.
 *
 * The cardinality `1 + ordinal(Max) - ordinal(Min)` is computed without
 * overflow: the difference is taken modulo 2^64, where it is exact because
 * the true span of any 64-bit type is below 2^64, and the `+ 1` happens only
 * after widening to Natural.
 *
 * @tparam T An integral or enum type with no gaps between Min and Max.
 * @tparam Min The first value.
 * @tparam Max The last value.
 */
template <detail::Ordinal T, T Min = std::numeric_limits<T>::min(),
          T Max = std::numeric_limits<T>::max()>
struct BoundedOrdinal {
    static_assert(detail::ToOrdinal(Min) <= detail::ToOrdinal(Max),
                  "BoundedOrdinal requires Min <= Max");

    [[nodiscard]] static std::vector<T> Enumerate() {
        std::vector<T> values;
        values.reserve(static_cast<std::size_t>(Span()) + 1);
        for (auto ordinal = detail::ToOrdinal(Min);; ++ordinal) {
            values.push_back(detail::FromOrdinal<T>(ordinal));
            if (ordinal == detail::ToOrdinal(Max)) {
                break;
            }
        }
        return values;
    }

    [[nodiscard]] static Natural Cardinality() { return Natural{Span()} + 1; }

   private:
    [[nodiscard]] static constexpr uint64_t Span() noexcept {
        return static_cast<uint64_t>(detail::ToOrdinal(Max)) -
               static_cast<uint64_t>(detail::ToOrdinal(Min));
    }
};

/**
 * @brief Concept for a successor policy used by SuccessorFromZero.
 *
 * `origin()` is the first value (std::nullopt for an empty type), and
 * `next(v)` is the value after v (std::nullopt after the last value).
 */
template <typename Step, typename T>
concept SuccessorStep = requires(const T& value) {
    { Step::origin() } -> std::same_as<std::optional<T>>;
    { Step::next(value) } -> std::same_as<std::optional<T>>;
};

/**
 * @brief Successor policy for enums declared with a trailing COUNT sentinel,
 * numbered contiguously from zero.
 */
template <typename E>
    requires std::is_enum_v<E> && requires { E::COUNT; }
struct CountSentinelStep {
    [[nodiscard]] static constexpr std::optional<E> origin() noexcept {
        return at(0);
    }

    [[nodiscard]] static constexpr std::optional<E> next(const E& value) noexcept {
        return at(detail::ToOrdinal(value) + 1);
    }

   private:
    template <typename O>
    [[nodiscard]] static constexpr std::optional<E> at(O ordinal) noexcept {
        if (ordinal >= detail::ToOrdinal(E::COUNT)) {
            return std::nullopt;
        }
        return detail::FromOrdinal<E>(ordinal);
    }
};

/**
 * @brief Strategy for types generated by repeatedly stepping from an origin.
 *
 * There is no closed form for the cardinality, so it falls back to the
 * length of the enumeration. Only valid for types whose Step is known to
 * terminate.
 *
 * @tparam T The enumerated type.
 * @tparam Step A SuccessorStep policy for T.
 */
template <typename T, typename Step = CountSentinelStep<T>>
    requires SuccessorStep<Step, T>
struct SuccessorFromZero {
    [[nodiscard]] static std::vector<T> Enumerate() {
        std::vector<T> values;
        for (auto value = Step::origin(); value.has_value();
             value = Step::next(*value)) {
            values.push_back(*value);
        }
        return values;
    }

    [[nodiscard]] static Natural Cardinality() {
        return Natural{Enumerate().size()};
    }
};

/**
 * @brief Strategy for types with no ordinal structure.
 *
 * The derived Traits lists every value in a `static constexpr std::array`
 * named `values`. Duplicate entries are rejected at compile time.
 *
 * @code
 * template <>
 * struct Traits<std::cv_status> : Literal<Traits<std::cv_status>> {
 *     static constexpr std::array values{std::cv_status::no_timeout,
 *                                        std::cv_status::timeout};
 * };
 * @endcode
 *
 * @tparam Self The Traits specialization holding `values`.
 */
template <typename Self>
struct Literal {
    [[nodiscard]] static auto Enumerate() {
        static_assert(detail::AllDistinct(Self::values),
                      "Literal values must be distinct");
        using T = typename decltype(Self::values)::value_type;
        return std::vector<T>(Self::values.begin(), Self::values.end());
    }

    [[nodiscard]] static Natural Cardinality() {
        return Natural{Self::values.size()};
    }
};

/**
 * @brief Marker for types too large to enumerate.
 *
 * Provides the cardinality only. A type whose Traits inherits Large is
 * TooLarge: Cardinality<T>() works, Enumerate<T>() does not compile.
 *
 * @tparam T The marked type.
 * @tparam Counter Any Countable strategy for T, used for its cardinality.
 */
template <typename T, typename Counter = BoundedOrdinal<T>>
struct Large {
    [[nodiscard]] static Natural Cardinality() {
        return Counter::Cardinality();
    }
};

}  // namespace Census
