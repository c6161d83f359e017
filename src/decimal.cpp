/**
 * @file decimal.cpp
 * @brief Packed decimal construction: validate, decompose, pack.
 */

#include <packdec/decimal.hpp>
#include <packdec/decomposer.hpp>
#include <packdec/packer.hpp>
#include <packdec/validator.hpp>

#include <cassert>

#if !PACKDEC_NO_EXCEPTIONS
#include <string>
#endif

namespace packdec {

Error parse(std::string_view text, DecimalValue& out) {
    if (static_cast<std::uint64_t>(text.size()) > MAX_INPUT_LENGTH) [[unlikely]] {
        return Error::Overflow;
    }

    std::size_t error_pos = 0;
    auto result = validate(text, error_pos);
    if (result != Error::Ok) {
        return result;
    }

    const Decomposition parts = decompose(text);
    if (parts.sign == Sign::Zero) {
        out = DecimalValue();
        return Error::Ok;
    }

    std::vector<std::uint8_t> packed;
    result = pack_digits(text, packed);
    if (result != Error::Ok) {
        return result;
    }

    out = DecimalValue(parts.fractional_digit_count, parts.sign, std::move(packed));
    return Error::Ok;
}

std::optional<DecimalValue> construct(std::string_view text) {
    DecimalValue value;
    const auto result = parse(text, value);
    if (result == Error::Ok) {
        return value;
    }

    // Anything but a rejected literal means validate() let a bad literal through
    assert(is_input_error(result) && "packer rejected a validated literal");
    return std::nullopt;
}

#if !PACKDEC_NO_EXCEPTIONS

DecimalValue construct_or_throw(std::string_view text) {
    DecimalValue value;
    const auto result = parse(text, value);

    switch (result) {
    case Error::Ok:
        return value;
    case Error::Malformed:
        throw_error(result, "Malformed decimal literal: \"" + std::string(text) + "\"");
    case Error::Overflow:
        throw_error(result, "Decimal literal of " + std::to_string(text.size()) +
                                " bytes exceeds the maximum length");
    default:
        throw_error(result, error_string(result));
    }
}

#endif // !PACKDEC_NO_EXCEPTIONS

} // namespace packdec
