/**
 * @file packer.cpp
 * @brief Two-digits-per-byte packing of a validated literal.
 */

#include <packdec/packer.hpp>
#include <packdec/validator.hpp>

#include <string>
#include <utility>

namespace packdec {

namespace {

constexpr bool is_skipped(char c) noexcept {
    return c == PLUS_SIGN || c == MINUS_SIGN || c == DECIMAL_POINT;
}

} // namespace

std::size_t count_digits(std::string_view text) noexcept {
    std::size_t count = 0;
    for (char c : text) {
        if (is_ascii_digit(c)) {
            ++count;
        }
    }
    return count;
}

Error pack_digits(std::string_view text, std::vector<std::uint8_t>& out) {
    // Digit string, with room for the padding digit
    std::string digits;
    digits.reserve(text.size() + 1);

    for (char c : text) {
        if (is_skipped(c)) {
            continue;
        }
        if (!is_ascii_digit(c)) [[unlikely]] {
            return Error::InvalidDigit;
        }
        digits.push_back(c);
    }

    if (digits.empty()) {
        return Error::InvalidArg;
    }

    // Leading zero keeps the value and completes the top pair
    if ((digits.size() & 1U) != 0) {
        digits.insert(digits.begin(), '0');
    }

    const std::size_t num_bytes = digits.size() / DIGITS_PER_BYTE;
    std::vector<std::uint8_t> packed;
    packed.reserve(num_bytes);

    // Byte i takes the pair ending at offset 2*(N-i)-1
    for (std::size_t i = 0; i < num_bytes; ++i) {
        const std::size_t low_idx = 2 * (num_bytes - i) - 1;
        const auto high = static_cast<std::uint8_t>(digits[low_idx - 1] - '0');
        const auto low = static_cast<std::uint8_t>(digits[low_idx] - '0');
        packed.push_back(make_packed_byte(high, low));
    }

    out = std::move(packed);
    return Error::Ok;
}

} // namespace packdec
