#pragma once

#include <array>
#include <atomic>
#include <census/primitives/census_primitive.hpp>
#include <charconv>
#include <compare>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <ios>
#include <limits>
#include <locale>
#include <type_traits>

/**
 * @brief Traits for the finite types of the standard library.
 *
 * Integral types up to 16 bits are bounded-ordinal; wider ones are marked
 * Large. Types without ordinal structure list their values literally.
 */
namespace Census {

// Integral and character types.

template <>
struct Traits<bool> : BoundedOrdinal<bool> {};

template <>
struct Traits<char> : BoundedOrdinal<char> {};

template <>
struct Traits<signed char> : BoundedOrdinal<signed char> {};

template <>
struct Traits<unsigned char> : BoundedOrdinal<unsigned char> {};

template <>
struct Traits<char8_t> : BoundedOrdinal<char8_t> {};

template <>
struct Traits<char16_t> : BoundedOrdinal<char16_t> {};

template <>
struct Traits<short> : BoundedOrdinal<short> {};

template <>
struct Traits<unsigned short> : BoundedOrdinal<unsigned short> {};

template <>
struct Traits<std::byte>
    : BoundedOrdinal<std::byte, std::byte{0x00}, std::byte{0xFF}> {};

template <>
struct Traits<int> : Large<int> {};

template <>
struct Traits<unsigned int> : Large<unsigned int> {};

template <>
struct Traits<long> : Large<long> {};

template <>
struct Traits<unsigned long> : Large<unsigned long> {};

template <>
struct Traits<long long> : Large<long long> {};

template <>
struct Traits<unsigned long long> : Large<unsigned long long> {};

template <>
struct Traits<char32_t> : Large<char32_t> {};

// Windows has a 16-bit wchar_t.
template <>
struct Traits<wchar_t>
    : std::conditional_t<(sizeof(wchar_t) <= 2), BoundedOrdinal<wchar_t>,
                         Large<wchar_t>> {};

// Contiguous standard enums.

template <>
struct Traits<std::float_round_style>
    : BoundedOrdinal<std::float_round_style, std::round_indeterminate,
                     std::round_toward_neg_infinity> {};

template <>
struct Traits<std::codecvt_base::result>
    : BoundedOrdinal<std::codecvt_base::result, std::codecvt_base::ok,
                     std::codecvt_base::noconv> {};

// Comparison categories.

template <>
struct Traits<std::strong_ordering> : Literal<Traits<std::strong_ordering>> {
    static constexpr std::array values{std::strong_ordering::less,
                                       std::strong_ordering::equal,
                                       std::strong_ordering::greater};
};

template <>
struct Traits<std::weak_ordering> : Literal<Traits<std::weak_ordering>> {
    static constexpr std::array values{std::weak_ordering::less,
                                       std::weak_ordering::equivalent,
                                       std::weak_ordering::greater};
};

template <>
struct Traits<std::partial_ordering>
    : Literal<Traits<std::partial_ordering>> {
    static constexpr std::array values{
        std::partial_ordering::less, std::partial_ordering::equivalent,
        std::partial_ordering::greater, std::partial_ordering::unordered};
};

template <>
struct Traits<std::nullptr_t> : Literal<Traits<std::nullptr_t>> {
    static constexpr std::array<std::nullptr_t, 1> values{nullptr};
};

// Error and condition codes.

template <>
struct Traits<std::io_errc> : Literal<Traits<std::io_errc>> {
    static constexpr std::array values{std::io_errc::stream};
};

template <>
struct Traits<std::future_errc> : Literal<Traits<std::future_errc>> {
    static constexpr std::array values{
        std::future_errc::broken_promise,
        std::future_errc::future_already_retrieved,
        std::future_errc::promise_already_satisfied,
        std::future_errc::no_state};
};

// Status and mode tags.

template <>
struct Traits<std::future_status> : Literal<Traits<std::future_status>> {
    static constexpr std::array values{std::future_status::ready,
                                       std::future_status::timeout,
                                       std::future_status::deferred};
};

template <>
struct Traits<std::cv_status> : Literal<Traits<std::cv_status>> {
    static constexpr std::array values{std::cv_status::no_timeout,
                                       std::cv_status::timeout};
};

template <>
struct Traits<std::launch> : Literal<Traits<std::launch>> {
    static constexpr std::array values{
        std::launch::async, std::launch::deferred,
        std::launch::async | std::launch::deferred};
};

template <>
struct Traits<std::memory_order> : Literal<Traits<std::memory_order>> {
    static constexpr std::array values{
        std::memory_order::relaxed, std::memory_order::consume,
        std::memory_order::acquire, std::memory_order::release,
        std::memory_order::acq_rel, std::memory_order::seq_cst};
};

template <>
struct Traits<std::ios_base::seekdir> : Literal<Traits<std::ios_base::seekdir>> {
    static constexpr std::array values{std::ios_base::beg, std::ios_base::cur,
                                       std::ios_base::end};
};

// Only the named formats; combinations such as fixed | hex are not listed.
template <>
struct Traits<std::chars_format> : Literal<Traits<std::chars_format>> {
    static constexpr std::array values{
        std::chars_format::scientific, std::chars_format::fixed,
        std::chars_format::hex, std::chars_format::general};
};

}  // namespace Census
