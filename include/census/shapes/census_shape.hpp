#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

/**
 * @brief The generic shape algebra.
 *
 * A shape is a type describing the sum-of-products structure of another
 * type. Each node names the generic value type its enumeration produces:
 *
 * - Unit:            std::monostate
 * - Void:            Never (no values)
 * - Leaf<T>:         T
 * - Product<L, R>:   std::pair<L::Value, R::Value>
 * - Sum<L, R>:       std::variant<L::Value, R::Value> (index 0 is L)
 * - Labeled<Lb, S>:  S::Value
 */
namespace Census::shapes {

/**
 * @brief The value type of Void. Cannot be constructed.
 */
struct Never {
    Never() = delete;
};

/**
 * @brief Exactly one value, no data.
 */
struct Unit {
    using Value = std::monostate;
};

/**
 * @brief No values.
 */
struct Void {
    using Value = Never;
};

/**
 * @brief A field holding a primitive or previously derived type.
 */
template <typename T>
struct Leaf {
    using Value = T;
};

/**
 * @brief Two independent fields.
 */
template <typename L, typename R>
struct Product {
    using Value = std::pair<typename L::Value, typename R::Value>;
};

/**
 * @brief A tagged choice between two shapes.
 */
template <typename L, typename R>
struct Sum {
    using Value = std::variant<typename L::Value, typename R::Value>;
};

/**
 * @brief A shape annotated with metadata. Does not affect enumeration.
 *
 * @tparam Label A label type (FieldLabel, AlternativeLabel).
 * @tparam S The annotated shape.
 */
template <typename Label, typename S>
struct Labeled {
    using Value = typename S::Value;
};

/// @cond INTERNAL
namespace detail {

template <typename... Shapes>
struct product_of;

template <>
struct product_of<> {
    using type = Unit;
};

template <typename S>
struct product_of<S> {
    using type = S;
};

template <typename S, typename... Rest>
struct product_of<S, Rest...> {
    using type = Product<S, typename product_of<Rest...>::type>;
};

template <typename... Shapes>
struct sum_of;

template <>
struct sum_of<> {
    using type = Void;
};

template <typename S>
struct sum_of<S> {
    using type = S;
};

template <typename S, typename... Rest>
struct sum_of<S, Rest...> {
    using type = Sum<S, typename sum_of<Rest...>::type>;
};

}  // namespace detail
/// @endcond

/**
 * @brief Right-nested chain of Products, in field order.
 *
 * ProductOf<> is Unit and ProductOf<S> is S.
 */
template <typename... Shapes>
using ProductOf = typename detail::product_of<Shapes...>::type;

/**
 * @brief Right-nested chain of Sums, in alternative order.
 *
 * SumOf<> is Void and SumOf<S> is S.
 */
template <typename... Shapes>
using SumOf = typename detail::sum_of<Shapes...>::type;

/**
 * @brief Label naming one field of a type declared with CENSUS_FIELDS.
 *
 * @tparam T The owning type.
 * @tparam I The field position.
 */
template <typename T, std::size_t I>
struct FieldLabel {
    [[nodiscard]] static constexpr std::string_view name() noexcept {
        std::string_view names = T::census_field_names;
        for (std::size_t i = 0; i < I; ++i) {
            names.remove_prefix(std::min(names.find(',') + 1, names.size()));
        }
        names = names.substr(0, names.find(','));
        names.remove_prefix(std::min(names.find_first_not_of(' '),
                                     names.size()));
        return names.substr(0, names.find(' '));
    }

    [[nodiscard]] static std::string describe() {
        return std::string{name()};
    }
};

/**
 * @brief Label marking the I-th alternative of a sum.
 */
template <std::size_t I>
struct AlternativeLabel {
    // cppcheck-suppress unusedStructMember
    static constexpr std::size_t index = I;

    [[nodiscard]] static std::string describe() {
        return "#" + std::to_string(I);
    }
};

/**
 * @brief Concept for shape nodes.
 */
template <typename S>
concept Shape = requires { typename S::Value; };

/// @cond INTERNAL
namespace detail {

template <typename S>
struct describe;

template <>
struct describe<Unit> {
    static std::string get() { return "Unit"; }
};

template <>
struct describe<Void> {
    static std::string get() { return "Void"; }
};

template <typename T>
struct describe<Leaf<T>> {
    static std::string get() { return "Leaf"; }
};

template <typename L, typename R>
struct describe<Product<L, R>> {
    static std::string get() {
        return "Product(" + describe<L>::get() + ", " + describe<R>::get() +
               ")";
    }
};

template <typename L, typename R>
struct describe<Sum<L, R>> {
    static std::string get() {
        return "Sum(" + describe<L>::get() + ", " + describe<R>::get() + ")";
    }
};

template <typename Label, typename S>
struct describe<Labeled<Label, S>> {
    static std::string get() {
        return Label::describe() + ": " + describe<S>::get();
    }
};

}  // namespace detail
/// @endcond

/**
 * @brief Renders a shape tree as text, e.g.
 * `Product(x: Leaf, y: Leaf)`.
 */
template <Shape S>
[[nodiscard]] std::string Describe() {
    return detail::describe<S>::get();
}

}  // namespace Census::shapes
