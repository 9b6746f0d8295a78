#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Census {

/**
 * @brief Arbitrary-precision non-negative integer used for cardinalities.
 *
 * Products and power sets overflow any fixed-width counter, so every
 * cardinality is widened into a Natural before arithmetic is applied.
 *
 * Stored as little-endian 32-bit limbs with no trailing zero limbs, so zero
 * is the empty limb vector and equality is limb-wise equality.
 */
class Natural {
   public:
    constexpr Natural() noexcept = default;

    // cppcheck-suppress noExplicitConstructor
    constexpr Natural(uint64_t value) {
        while (value != 0) {
            limbs_.push_back(static_cast<uint32_t>(value));
            value >>= LimbBits;
        }
    }

    /**
     * @brief Converts a signed integer, so that plain literals work.
     *
     * @throws std::out_of_range if the value is negative.
     */
    template <std::signed_integral I>
    // cppcheck-suppress noExplicitConstructor
    constexpr Natural(I value) : Natural(NonNegative(value)) {}

    /**
     * @brief Computes 2 raised to the given exponent.
     *
     * @param exponent The power of two.
     * @return The Natural 2^exponent.
     * @throws std::length_error if the exponent does not fit in 64 bits; the
     * result would not fit in memory.
     */
    [[nodiscard]] static constexpr Natural Pow2(const Natural& exponent) {
        const auto bits = exponent.to_uint64();
        if (!bits.has_value()) {
            throw std::length_error("Natural::Pow2 exponent too large");
        }
        Natural out;
        out.limbs_.assign(static_cast<std::size_t>(*bits / LimbBits) + 1, 0);
        out.limbs_.back() = uint32_t{1} << (*bits % LimbBits);
        return out;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return limbs_.empty();
    }

    /**
     * @brief Narrows to uint64_t.
     *
     * @return The value, or std::nullopt if it does not fit in 64 bits.
     */
    [[nodiscard]] constexpr std::optional<uint64_t> to_uint64() const noexcept {
        if (limbs_.size() > 2) {
            return std::nullopt;
        }
        uint64_t value = 0;
        for (std::size_t i = limbs_.size(); i-- > 0;) {
            value = (value << LimbBits) | limbs_[i];
        }
        return value;
    }

    /**
     * @brief Renders the value in decimal.
     */
    [[nodiscard]] std::string to_string() const {
        if (is_zero()) {
            return "0";
        }

        // Peel off base-10^9 chunks, least significant first.
        std::vector<uint32_t> digits = limbs_;
        std::vector<uint32_t> chunks;
        while (!digits.empty()) {
            uint64_t remainder = 0;
            for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
                const uint64_t current = (remainder << LimbBits) | *it;
                *it = static_cast<uint32_t>(current / DecimalChunk);
                remainder = current % DecimalChunk;
            }
            chunks.push_back(static_cast<uint32_t>(remainder));
            while (!digits.empty() && digits.back() == 0) {
                digits.pop_back();
            }
        }

        std::string out = std::to_string(chunks.back());
        for (auto it = chunks.rbegin() + 1; it != chunks.rend(); ++it) {
            const std::string part = std::to_string(*it);
            out.append(DecimalChunkDigits - part.size(), '0');
            out += part;
        }
        return out;
    }

    constexpr Natural& operator+=(const Natural& rhs) {
        if (rhs.limbs_.size() > limbs_.size()) {
            limbs_.resize(rhs.limbs_.size(), 0);
        }
        uint64_t carry = 0;
        for (std::size_t i = 0; i < limbs_.size(); ++i) {
            if (carry == 0 && i >= rhs.limbs_.size()) {
                break;
            }
            const uint64_t addend = i < rhs.limbs_.size() ? rhs.limbs_[i] : 0;
            const uint64_t sum = uint64_t{limbs_[i]} + addend + carry;
            limbs_[i] = static_cast<uint32_t>(sum);
            carry = sum >> LimbBits;
        }
        if (carry != 0) {
            limbs_.push_back(static_cast<uint32_t>(carry));
        }
        return *this;
    }

    constexpr Natural& operator*=(const Natural& rhs) {
        *this = *this * rhs;
        return *this;
    }

    [[nodiscard]] friend constexpr Natural operator+(Natural lhs,
                                                     const Natural& rhs) {
        lhs += rhs;
        return lhs;
    }

    /**
     * @brief Schoolbook multiplication.
     */
    [[nodiscard]] friend constexpr Natural operator*(const Natural& lhs,
                                                     const Natural& rhs) {
        if (lhs.is_zero() || rhs.is_zero()) {
            return Natural{};
        }
        Natural out;
        out.limbs_.assign(lhs.limbs_.size() + rhs.limbs_.size(), 0);
        for (std::size_t i = 0; i < lhs.limbs_.size(); ++i) {
            uint64_t carry = 0;
            for (std::size_t j = 0; j < rhs.limbs_.size(); ++j) {
                const uint64_t current =
                    uint64_t{out.limbs_[i + j]} +
                    uint64_t{lhs.limbs_[i]} * rhs.limbs_[j] + carry;
                out.limbs_[i + j] = static_cast<uint32_t>(current);
                carry = current >> LimbBits;
            }
            out.limbs_[i + rhs.limbs_.size()] = static_cast<uint32_t>(carry);
        }
        out.trim();
        return out;
    }

    [[nodiscard]] friend constexpr bool operator==(const Natural&,
                                                   const Natural&) = default;

    [[nodiscard]] friend constexpr std::strong_ordering operator<=>(
        const Natural& lhs, const Natural& rhs) noexcept {
        if (lhs.limbs_.size() != rhs.limbs_.size()) {
            return lhs.limbs_.size() <=> rhs.limbs_.size();
        }
        for (std::size_t i = lhs.limbs_.size(); i-- > 0;) {
            if (lhs.limbs_[i] != rhs.limbs_[i]) {
                return lhs.limbs_[i] <=> rhs.limbs_[i];
            }
        }
        return std::strong_ordering::equal;
    }

    friend std::ostream& operator<<(std::ostream& os, const Natural& value) {
        return os << value.to_string();
    }

   private:
    template <std::signed_integral I>
    [[nodiscard]] static constexpr uint64_t NonNegative(I value) {
        if (value < 0) {
            throw std::out_of_range("Natural cannot hold a negative value");
        }
        return static_cast<uint64_t>(value);
    }

    static constexpr std::size_t LimbBits = 32;
    static constexpr uint64_t DecimalChunk = 1'000'000'000;
    static constexpr std::size_t DecimalChunkDigits = 9;

    constexpr void trim() noexcept {
        while (!limbs_.empty() && limbs_.back() == 0) {
            limbs_.pop_back();
        }
    }

    std::vector<uint32_t> limbs_;
};

}  // namespace Census
