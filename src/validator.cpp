/**
 * @file validator.cpp
 * @brief Decimal literal grammar check.
 */

#include <packdec/validator.hpp>

namespace packdec {

namespace {

constexpr bool is_sign(char c) noexcept {
    return c == PLUS_SIGN || c == MINUS_SIGN;
}

Error reject(std::size_t pos, std::size_t& error_pos) noexcept {
    error_pos = pos;
    return Error::Malformed;
}

} // namespace

Error validate(std::string_view text, std::size_t& error_pos) noexcept {
    if (text.empty()) [[unlikely]] {
        return reject(0, error_pos);
    }

    const char first = text.front();
    if (!is_sign(first) && !is_ascii_digit(first)) {
        return reject(0, error_pos);
    }

    // A lone sign has no digit to end on
    const std::size_t last = text.size() - 1;
    if (last == 0) {
        return is_ascii_digit(first) ? Error::Ok : reject(0, error_pos);
    }

    bool seen_point = false;
    for (std::size_t i = 1; i < text.size(); ++i) {
        const char c = text[i];

        if ((i == 1 || i == last) && !is_ascii_digit(c)) {
            return reject(i, error_pos);
        }

        if (c == DECIMAL_POINT) {
            if (seen_point) {
                return reject(i, error_pos);
            }
            seen_point = true;
            continue;
        }

        if (!is_ascii_digit(c)) {
            return reject(i, error_pos);
        }
    }

    return Error::Ok;
}

bool is_valid(std::string_view text) noexcept {
    std::size_t error_pos = 0;
    return validate(text, error_pos) == Error::Ok;
}

} // namespace packdec
