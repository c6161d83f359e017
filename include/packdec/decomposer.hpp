/**
 * @file decomposer.hpp
 * @brief Sign and scale extraction from a validated literal.
 *
 * All functions here expect text already accepted by validate().
 */

#ifndef PACKDEC_DECOMPOSER_HPP
#define PACKDEC_DECOMPOSER_HPP

#include "config.hpp"
#include "sign.hpp"

#include <string_view>

namespace packdec {

/**
 * @brief Sign and fractional digit count of a literal.
 */
struct Decomposition {
    Sign sign = Sign::Zero;
    std::uint32_t fractional_digit_count = 0;
};

/**
 * @brief Check whether a literal takes the zero path.
 *
 * Any literal whose first character is '0' is treated as zero, including
 * literals such as "0.5".
 */
[[nodiscard]] constexpr bool is_zero_leading(std::string_view text) noexcept {
    return !text.empty() && text.front() == '0';
}

/**
 * @brief Check whether every digit of a literal is '0'.
 *
 * True for "-0", "+0.000" and "000"; such literals are exactly zero
 * whatever their sign character.
 */
[[nodiscard]] bool is_zero_value(std::string_view text) noexcept;

/**
 * @brief Count the digits after the first decimal point.
 *
 * Counts up to the next point or the end of the text.
 *
 * @param text Validated literal
 * @return Number of fractional digits, 0 without a point
 */
[[nodiscard]] std::uint32_t count_fractional_digits(std::string_view text) noexcept;

/**
 * @brief Derive the sign and scale of a validated literal.
 *
 * Zero-leading and all-zero literals yield Sign::Zero with a count of 0;
 * the caller then skips packing and uses the canonical zero. Otherwise a
 * leading '-' yields Sign::Negative and anything else Sign::Positive.
 *
 * @param text Validated literal
 * @return Sign and fractional digit count
 */
[[nodiscard]] Decomposition decompose(std::string_view text) noexcept;

} // namespace packdec

#endif // PACKDEC_DECOMPOSER_HPP
