/**
 * @file decimal.hpp
 * @brief Packed decimal record and its construction from text.
 *
 * A DecimalValue carries three independent fields:
 * - the fractional digit count (the scale)
 * - the sign tag
 * - the packed digits, two per byte, least-significant pair first
 *
 * Records are immutable. A non-zero record can only be produced by
 * parsing a literal, so every record reflects a literal that passed
 * validation in full.
 */

#ifndef PACKDEC_DECIMAL_HPP
#define PACKDEC_DECIMAL_HPP

#include "config.hpp"
#include "error.hpp"
#include "sign.hpp"

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace packdec {

class DecimalValue;

Error parse(std::string_view text, DecimalValue& out);

/**
 * @brief Immutable packed decimal record.
 */
class DecimalValue {
public:
    /**
     * @brief Canonical zero: scale 0, Sign::Zero, digits { 0x00 }.
     */
    DecimalValue() : fractional_digit_count_(0), sign_(Sign::Zero), packed_digits_{0x00U} {}

    /**
     * @brief Number of digits after the decimal point in the source literal.
     */
    [[nodiscard]] std::uint32_t fractional_digit_count() const noexcept {
        return fractional_digit_count_;
    }

    [[nodiscard]] Sign sign() const noexcept { return sign_; }

    /**
     * @brief Packed digits, least-significant pair first. Never empty.
     */
    [[nodiscard]] const std::vector<std::uint8_t>& packed_digits() const noexcept {
        return packed_digits_;
    }

    [[nodiscard]] bool is_zero() const noexcept { return sign_ == Sign::Zero; }

    bool operator==(const DecimalValue& other) const = default;

private:
    DecimalValue(std::uint32_t fractional_digit_count, Sign sign,
                 std::vector<std::uint8_t> packed_digits) noexcept
        : fractional_digit_count_(fractional_digit_count), sign_(sign),
          packed_digits_(std::move(packed_digits)) {}

    friend Error parse(std::string_view text, DecimalValue& out);

    std::uint32_t fractional_digit_count_;
    Sign sign_;
    std::vector<std::uint8_t> packed_digits_;
};

/**
 * @brief Parse a decimal literal into a packed record.
 *
 * @param text Literal such as "-99084.566"
 * @param[out] out Receives the record. Left untouched on failure.
 * @return Error::Ok on success, Error::Malformed if the literal fails the
 *         grammar, Error::Overflow if it is longer than MAX_INPUT_LENGTH
 */
Error parse(std::string_view text, DecimalValue& out);

/**
 * @brief Build a packed record from a decimal literal.
 *
 * Invalid input is an expected case and yields an empty optional; no
 * detail is given about why the literal was rejected.
 *
 * @param text Literal such as "+1234.56789"
 * @return The record, or std::nullopt if the literal is rejected
 */
[[nodiscard]] std::optional<DecimalValue> construct(std::string_view text);

#if !PACKDEC_NO_EXCEPTIONS

/**
 * @brief Build a packed record, throwing on rejected input.
 *
 * @throws MalformedInputException if the literal fails the grammar
 * @throws OverflowException if the literal is longer than MAX_INPUT_LENGTH
 * @throws PackdecException for any other failure
 */
DecimalValue construct_or_throw(std::string_view text);

#endif // !PACKDEC_NO_EXCEPTIONS

} // namespace packdec

#endif // PACKDEC_DECIMAL_HPP
