/**
 * @file sign.hpp
 * @brief Sign tag carried beside the packed digits.
 */

#ifndef PACKDEC_SIGN_HPP
#define PACKDEC_SIGN_HPP

namespace packdec {

/**
 * @brief Sign of a decimal value.
 *
 * Zero is its own tag and is never combined with Positive or Negative,
 * whatever sign character the literal started with.
 */
enum class Sign {
    Positive,
    Negative,
    Zero
};

/**
 * @brief Get the display name of a sign.
 * @param sign Sign tag
 * @return "Positive", "Negative" or "Zero"
 */
inline const char* sign_name(Sign sign) noexcept {
    switch (sign) {
    case Sign::Positive:
        return "Positive";
    case Sign::Negative:
        return "Negative";
    case Sign::Zero:
        return "Zero";
    default:
        return "Unknown";
    }
}

} // namespace packdec

#endif // PACKDEC_SIGN_HPP
