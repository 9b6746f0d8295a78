#pragma once

#include <array>
#include <census/core/census_natural.hpp>
#include <census/primitives/census_primitive.hpp>
#include <census/shapes/census_engine.hpp>
#include <census/shapes/census_shape.hpp>
#include <concepts>
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Macro to declare the enumerated fields of a product type.
 *
 * Generates `census_fields()` methods (const and non-const) returning a tuple
 * of references to the listed members, and `census_field_names` holding the
 * listed names. Fields are enumerated in the listed order, the last one
 * varying fastest.
 *
 * The type must be default constructible; values are produced by
 * default-constructing and then assigning every listed field.
 *
 * @param ... The member variables to include.
 */
#define CENSUS_FIELDS(...)                                                \
    static constexpr std::string_view census_field_names = #__VA_ARGS__; \
    constexpr auto census_fields() const { return std::tie(__VA_ARGS__); } \
    constexpr auto census_fields() { return std::tie(__VA_ARGS__); }

namespace Census {

/**
 * @brief The isomorphism between a type and its generic shape.
 *
 * A specialization for T supplies:
 * - `using Shape`: the shape tree built from T's declared structure.
 * - `static T From(Shape::Value)`: rebuilds a T from a generic value.
 * - `static Shape::Value To(const T&)`: decomposes a T into a generic value.
 *
 * Every type with a Generic specialization whose shape is acyclic is
 * Enumerable (or Countable) without further code.
 */
template <typename T>
struct Generic {};

/**
 * @brief Concept for types with a generic shape.
 */
template <typename T>
concept HasShape = requires(typename Generic<T>::Shape::Value value,
                            const T& t) {
    requires shapes::Shape<typename Generic<T>::Shape>;
    { Generic<T>::From(std::move(value)) } -> std::same_as<T>;
    {
        Generic<T>::To(t)
    } -> std::same_as<typename Generic<T>::Shape::Value>;
};

/// @cond INTERNAL
namespace detail {

template <typename S, typename Target, typename... Visited>
struct contains_leaf : std::false_type {};

template <typename L, typename R, typename Target, typename... Visited>
struct contains_leaf<shapes::Product<L, R>, Target, Visited...>
    : std::bool_constant<contains_leaf<L, Target, Visited...>::value ||
                         contains_leaf<R, Target, Visited...>::value> {};

template <typename L, typename R, typename Target, typename... Visited>
struct contains_leaf<shapes::Sum<L, R>, Target, Visited...>
    : std::bool_constant<contains_leaf<L, Target, Visited...>::value ||
                         contains_leaf<R, Target, Visited...>::value> {};

template <typename Label, typename S, typename Target, typename... Visited>
struct contains_leaf<shapes::Labeled<Label, S>, Target, Visited...>
    : contains_leaf<S, Target, Visited...> {};

template <typename U, typename Target, typename... Visited>
struct contains_leaf<shapes::Leaf<U>, Target, Visited...> {
    static constexpr bool value = [] {
        if constexpr (std::same_as<U, Target>) {
            return true;
        } else if constexpr ((std::same_as<U, Visited> || ...)) {
            // A cycle not involving Target; reported when U is derived.
            return false;
        } else if constexpr (requires { typename Generic<U>::Shape; }) {
            return contains_leaf<typename Generic<U>::Shape, Target, Visited...,
                                 U>::value;
        } else {
            return false;
        }
    }();
};

}  // namespace detail
/// @endcond

/**
 * @brief True when shape S reaches Leaf<T>, directly or through the shapes
 * of other types it contains.
 */
template <typename S, typename T>
inline constexpr bool contains_leaf_v = detail::contains_leaf<S, T>::value;

/**
 * @brief Concept for types whose Enumerable capability can be derived.
 *
 * Rejects self-referential shapes: a shape that reaches its own type would
 * unfold forever, so such a type is not Derivable and therefore neither
 * Countable nor Enumerable.
 */
template <typename T>
concept Derivable =
    HasShape<T> && !contains_leaf_v<typename Generic<T>::Shape, T>;

/**
 * @brief Traits implementation for Derivable types, delegating to the
 * Engine over the type's shape and mapping results through Generic::From.
 */
template <Derivable T>
struct Derived {
    using Shape = typename Generic<T>::Shape;

    [[nodiscard]] static Natural Cardinality()
        requires shapes::CountableShape<Shape>
    {
        return shapes::Engine<Shape>::Cardinality();
    }

    [[nodiscard]] static std::vector<T> Enumerate(std::stop_token token = {})
        requires shapes::EnumerableShape<Shape>
    {
        auto generic = shapes::Engine<Shape>::Enumerate(std::move(token));
        std::vector<T> values;
        values.reserve(generic.size());
        for (auto&& value : generic) {
            values.push_back(Generic<T>::From(std::move(value)));
        }
        return values;
    }
};

template <Derivable T>
struct Traits<T> : Derived<T> {};

/// @cond INTERNAL
namespace detail {

template <typename Tuple>
struct value_types;

template <typename... Ts>
struct value_types<std::tuple<Ts...>> {
    using type = std::tuple<std::remove_cvref_t<Ts>...>;
};

/**
 * @brief Nests the elements of a tuple, from index I on, into the
 * right-nested pairs of a ProductOf shape.
 */
template <std::size_t I, typename Tuple>
[[nodiscard]] constexpr auto NestProduct(const Tuple& tuple) {
    constexpr std::size_t N = std::tuple_size_v<std::remove_cvref_t<Tuple>>;
    if constexpr (N == 0) {
        return std::monostate{};
    } else if constexpr (I + 1 == N) {
        using Last = std::remove_cvref_t<std::tuple_element_t<I, Tuple>>;
        return Last(std::get<I>(tuple));
    } else {
        using Head = std::remove_cvref_t<std::tuple_element_t<I, Tuple>>;
        auto tail = NestProduct<I + 1>(tuple);
        return std::pair<Head, decltype(tail)>{std::get<I>(tuple),
                                               std::move(tail)};
    }
}

/**
 * @brief Inverse of NestProduct: flattens N right-nested values into a
 * tuple.
 */
template <std::size_t N, typename Nested>
[[nodiscard]] constexpr auto FlattenProduct(Nested&& nested) {
    if constexpr (N == 0) {
        return std::tuple<>{};
    } else if constexpr (N == 1) {
        return std::make_tuple(std::forward<Nested>(nested));
    } else {
        return std::tuple_cat(
            std::make_tuple(std::forward<Nested>(nested).first),
            FlattenProduct<N - 1>(std::forward<Nested>(nested).second));
    }
}

template <typename... Ts>
struct nested_alternatives;

template <typename T>
struct nested_alternatives<T> {
    using type = T;
};

template <typename T, typename... Rest>
struct nested_alternatives<T, Rest...> {
    using type = std::variant<T, typename nested_alternatives<Rest...>::type>;
};

/**
 * @brief The value type of SumOf for alternatives I..N-1 of a variant.
 */
template <std::size_t I, typename Variant>
struct nested_sum;

template <std::size_t I, typename T, typename... Ts>
    requires(I > 0)
struct nested_sum<I, std::variant<T, Ts...>>
    : nested_sum<I - 1, std::variant<Ts...>> {};

template <typename... Ts>
struct nested_sum<0, std::variant<Ts...>> : nested_alternatives<Ts...> {};

template <std::size_t, typename T>
using repeat = T;

/**
 * @brief Rebuilds a variant from the right-nested Sum value holding
 * alternatives I..N-1.
 */
template <typename Variant, std::size_t I, typename Nested>
[[nodiscard]] constexpr Variant UnnestSum(Nested&& nested) {
    constexpr std::size_t N = std::variant_size_v<Variant>;
    if constexpr (I + 1 == N) {
        return Variant{std::in_place_index<I>, std::forward<Nested>(nested)};
    } else {
        if (nested.index() == 0) {
            return Variant{std::in_place_index<I>,
                           std::get<0>(std::forward<Nested>(nested))};
        }
        return UnnestSum<Variant, I + 1>(
            std::get<1>(std::forward<Nested>(nested)));
    }
}

/**
 * @brief Decomposes a variant into the right-nested Sum value holding
 * alternatives I..N-1.
 */
template <std::size_t I, typename Variant>
[[nodiscard]] constexpr auto NestSum(const Variant& variant) ->
    typename nested_sum<I, Variant>::type {
    constexpr std::size_t N = std::variant_size_v<Variant>;
    using Nested = typename nested_sum<I, Variant>::type;
    if constexpr (I + 1 == N) {
        return std::get<I>(variant);
    } else {
        if (variant.index() == I) {
            return Nested{std::in_place_index<0>, std::get<I>(variant)};
        }
        return Nested{std::in_place_index<1>, NestSum<I + 1>(variant)};
    }
}

}  // namespace detail
/// @endcond

/**
 * @brief Concept for types declaring CENSUS_FIELDS.
 */
template <typename T>
concept HasCensusFields =
    std::default_initializable<T> && requires(const T& t, T& m) {
        { T::census_field_names } -> std::convertible_to<std::string_view>;
        t.census_fields();
        m.census_fields();
    };

/**
 * @brief Generic for CENSUS_FIELDS types: a product of the listed fields,
 * each labeled with its name.
 */
template <HasCensusFields T>
struct Generic<T> {
   private:
    using Fields = typename detail::value_types<
        decltype(std::declval<const T&>().census_fields())>::type;
    static constexpr std::size_t N = std::tuple_size_v<Fields>;

    template <std::size_t... Is>
    static auto shape_of(std::index_sequence<Is...>)
        -> shapes::ProductOf<shapes::Labeled<
            shapes::FieldLabel<T, Is>,
            shapes::Leaf<std::tuple_element_t<Is, Fields>>>...>;

   public:
    using Shape = decltype(shape_of(std::make_index_sequence<N>{}));

    [[nodiscard]] static T From(typename Shape::Value value) {
        T out{};
        out.census_fields() = detail::FlattenProduct<N>(std::move(value));
        return out;
    }

    [[nodiscard]] static typename Shape::Value To(const T& value) {
        return detail::NestProduct<0>(value.census_fields());
    }
};

template <>
struct Generic<std::monostate> {
    using Shape = shapes::Unit;

    [[nodiscard]] static std::monostate From(std::monostate value) {
        return value;
    }

    [[nodiscard]] static std::monostate To(std::monostate value) {
        return value;
    }
};

template <typename A, typename B>
struct Generic<std::pair<A, B>> {
    using Shape = shapes::Product<shapes::Leaf<A>, shapes::Leaf<B>>;

    [[nodiscard]] static std::pair<A, B> From(typename Shape::Value value) {
        return value;
    }

    [[nodiscard]] static typename Shape::Value To(
        const std::pair<A, B>& value) {
        return value;
    }
};

template <typename... Ts>
struct Generic<std::tuple<Ts...>> {
    using Shape = shapes::ProductOf<shapes::Leaf<Ts>...>;

    [[nodiscard]] static std::tuple<Ts...> From(typename Shape::Value value) {
        return detail::FlattenProduct<sizeof...(Ts)>(std::move(value));
    }

    [[nodiscard]] static typename Shape::Value To(
        const std::tuple<Ts...>& value) {
        return detail::NestProduct<0>(value);
    }
};

template <typename T, std::size_t N>
struct Generic<std::array<T, N>> {
   private:
    template <std::size_t... Is>
    static auto shape_of(std::index_sequence<Is...>)
        -> shapes::ProductOf<detail::repeat<Is, shapes::Leaf<T>>...>;

   public:
    using Shape = decltype(shape_of(std::make_index_sequence<N>{}));

    [[nodiscard]] static std::array<T, N> From(typename Shape::Value value) {
        return std::apply(
            [](auto&&... elements) {
                return std::array<T, N>{
                    std::forward<decltype(elements)>(elements)...};
            },
            detail::FlattenProduct<N>(std::move(value)));
    }

    [[nodiscard]] static typename Shape::Value To(
        const std::array<T, N>& value) {
        return detail::NestProduct<0>(value);
    }
};

/**
 * @brief Optional is a sum of the empty state and a value; the empty state
 * comes first.
 */
template <typename T>
struct Generic<std::optional<T>> {
    using Shape = shapes::Sum<shapes::Unit, shapes::Leaf<T>>;

    [[nodiscard]] static std::optional<T> From(typename Shape::Value value) {
        if (value.index() == 0) {
            return std::nullopt;
        }
        return std::optional<T>{std::get<1>(std::move(value))};
    }

    [[nodiscard]] static typename Shape::Value To(
        const std::optional<T>& value) {
        if (!value.has_value()) {
            return typename Shape::Value{std::in_place_index<0>};
        }
        return typename Shape::Value{std::in_place_index<1>, *value};
    }
};

/**
 * @brief Variant is a sum of its alternatives in declaration order, each
 * labeled with its index.
 */
template <typename... Ts>
struct Generic<std::variant<Ts...>> {
   private:
    template <std::size_t... Is>
    static auto shape_of(std::index_sequence<Is...>)
        -> shapes::SumOf<shapes::Labeled<shapes::AlternativeLabel<Is>,
                                         shapes::Leaf<Ts>>...>;

   public:
    using Shape =
        decltype(shape_of(std::make_index_sequence<sizeof...(Ts)>{}));

    [[nodiscard]] static std::variant<Ts...> From(
        typename Shape::Value value) {
        return detail::UnnestSum<std::variant<Ts...>, 0>(std::move(value));
    }

    [[nodiscard]] static typename Shape::Value To(
        const std::variant<Ts...>& value) {
        return detail::NestSum<0>(value);
    }
};

/**
 * @brief Renders the shape tree of a Derivable type.
 */
template <HasShape T>
[[nodiscard]] std::string Describe() {
    return shapes::Describe<typename Generic<T>::Shape>();
}

}  // namespace Census
