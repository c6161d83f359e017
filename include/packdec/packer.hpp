/**
 * @file packer.hpp
 * @brief Two-digits-per-byte packing of a validated literal.
 *
 * Sign characters and the decimal point are stripped, leaving the digit
 * string. An odd-length digit string gets a leading '0' so every byte
 * holds a full pair.
 *
 * @par Byte Ordering
 * Pairs are stored least-significant first:
 * - byte 0 holds the last two digits of the (padded) digit string
 * - byte N-1 holds the first two digits
 *
 * Within a byte the earlier digit is the high nibble, so each byte reads
 * in normal order when printed as hex:
 * @code
 * "+1234.56789" -> "0123456789" -> { 0x89, 0x67, 0x45, 0x23, 0x01 }
 * @endcode
 */

#ifndef PACKDEC_PACKER_HPP
#define PACKDEC_PACKER_HPP

#include "config.hpp"
#include "error.hpp"

#include <string_view>
#include <vector>

namespace packdec {

/**
 * @brief Combine two digit values into one packed byte.
 * @param high Digit stored in bits 7-4
 * @param low Digit stored in bits 3-0
 */
constexpr std::uint8_t make_packed_byte(std::uint8_t high, std::uint8_t low) noexcept {
    return static_cast<std::uint8_t>(((high & NIBBLE_MASK) << NIBBLE_BITS) | (low & NIBBLE_MASK));
}

/// Digit stored in bits 7-4.
constexpr std::uint8_t high_nibble(std::uint8_t byte) noexcept {
    return static_cast<std::uint8_t>(byte >> NIBBLE_BITS);
}

/// Digit stored in bits 3-0.
constexpr std::uint8_t low_nibble(std::uint8_t byte) noexcept {
    return static_cast<std::uint8_t>(byte & NIBBLE_MASK);
}

/**
 * @brief Number of bytes needed for a digit count.
 * @param digit_count Number of decimal digits
 * @return ceil(digit_count / 2)
 */
constexpr std::size_t packed_length(std::size_t digit_count) noexcept {
    return (digit_count + DIGITS_PER_BYTE - 1U) / DIGITS_PER_BYTE;
}

/**
 * @brief Count the ASCII digits in a literal.
 */
[[nodiscard]] std::size_t count_digits(std::string_view text) noexcept;

/**
 * @brief Pack the digits of a validated literal.
 *
 * '+', '-' and '.' are skipped wherever they appear. Any other non-digit
 * character means the literal was never validated; it is reported, not
 * coerced.
 *
 * @param text Validated, non-zero-leading literal
 * @param[out] out Packed digits, least-significant pair first. Written
 *             only on success.
 * @return Error::Ok on success, Error::InvalidDigit if a non-digit
 *         character is found, Error::InvalidArg if there are no digits
 */
Error pack_digits(std::string_view text, std::vector<std::uint8_t>& out);

} // namespace packdec

#endif // PACKDEC_PACKER_HPP
