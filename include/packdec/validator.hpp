/**
 * @file validator.hpp
 * @brief Decimal literal grammar check.
 *
 * Accepted grammar, over the raw characters of the literal:
 * - the literal is not empty
 * - the first character is '+', '-' or a digit
 * - the second character, if any, is a digit
 * - the last character is a digit
 * - every other character is a digit or '.', with at most one '.'
 *
 * Only ASCII '0'-'9' count as digits. Any byte of a multi-byte UTF-8
 * sequence fails the character class, so scanning bytes accepts exactly
 * the same literals as scanning code points.
 */

#ifndef PACKDEC_VALIDATOR_HPP
#define PACKDEC_VALIDATOR_HPP

#include "config.hpp"
#include "error.hpp"

#include <string_view>

namespace packdec {

/**
 * @brief Check whether a character is an ASCII decimal digit.
 *
 * Locale-independent replacement for std::isdigit.
 */
constexpr bool is_ascii_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

/**
 * @brief Validate a decimal literal and locate the first offending character.
 *
 * @param text Literal to check
 * @param[out] error_pos Offset of the first rejected character; 0 for empty
 *             input. Left untouched on success.
 * @return Error::Ok if the literal is accepted, Error::Malformed otherwise
 */
Error validate(std::string_view text, std::size_t& error_pos) noexcept;

/**
 * @brief Check a decimal literal against the grammar.
 * @param text Literal to check
 * @return true if the literal is accepted
 */
[[nodiscard]] bool is_valid(std::string_view text) noexcept;

} // namespace packdec

#endif // PACKDEC_VALIDATOR_HPP
