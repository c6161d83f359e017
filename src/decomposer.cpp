/**
 * @file decomposer.cpp
 * @brief Sign and scale extraction from a validated literal.
 */

#include <packdec/decomposer.hpp>

namespace packdec {

bool is_zero_value(std::string_view text) noexcept {
    for (char c : text) {
        if (c >= '1' && c <= '9') {
            return false;
        }
    }
    return true;
}

std::uint32_t count_fractional_digits(std::string_view text) noexcept {
    const std::size_t point = text.find(DECIMAL_POINT);
    if (point == std::string_view::npos) {
        return 0;
    }

    std::string_view fraction = text.substr(point + 1);
    const std::size_t next_point = fraction.find(DECIMAL_POINT);
    if (next_point != std::string_view::npos) {
        fraction = fraction.substr(0, next_point);
    }

    // Bounded by MAX_INPUT_LENGTH before any literal gets here
    return static_cast<std::uint32_t>(fraction.size());
}

Decomposition decompose(std::string_view text) noexcept {
    Decomposition result;

    if (is_zero_leading(text) || is_zero_value(text)) {
        return result;
    }

    result.sign = (text.front() == MINUS_SIGN) ? Sign::Negative : Sign::Positive;
    result.fractional_digit_count = count_fractional_digits(text);
    return result;
}

} // namespace packdec
