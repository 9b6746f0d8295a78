#pragma once

#include <cstdint>
#include <string_view>

namespace Census {

/**
 * @brief Error codes representing the recoverable outcomes of guarded
 * enumeration.
 */
enum class ErrorCode : uint8_t {
    UNKNOWN = 0,       ///< Unknown error.
    SizeRejected,      ///< Cardinality met or exceeded the caller's ceiling.
    DeadlineExceeded,  ///< Materialization did not finish before the
                       ///< deadline.
};

/**
 * @brief Represents an error returned by a guarded enumeration.
 *
 * Contains an error code and a descriptive message. Errors are ordinary
 * return values; callers are expected to branch on them.
 */
struct Error {
    ErrorCode code;  ///< The error code.
    // cppcheck-suppress unusedStructMember
    std::string_view message{};  ///< Static error message string.

    /**
     * @brief Creates an error representing a ceiling rejection.
     */
    [[nodiscard]] static constexpr Error size_rejected() noexcept {
        return {ErrorCode::SizeRejected, "cardinality not below ceiling"};
    }

    /**
     * @brief Creates an error representing an expired deadline.
     */
    [[nodiscard]] static constexpr Error deadline_exceeded() noexcept {
        return {ErrorCode::DeadlineExceeded, "deadline exceeded"};
    }

    [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept =
        default;

    /**
     * @brief Checks if the error matches a specific error code.
     */
    [[nodiscard]] constexpr bool operator==(ErrorCode c) const noexcept {
        return code == c;
    }
};

}  // namespace Census
