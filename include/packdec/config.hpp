/**
 * @file config.hpp
 * @brief packdec compile-time configuration.
 *
 * Packed decimal layout: two decimal digits per byte, one per nibble,
 * least-significant digit pair first.
 */

#ifndef PACKDEC_CONFIG_HPP
#define PACKDEC_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace packdec {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Longest accepted literal in bytes (not code points). The fractional
/// digit count is stored as uint32_t, so the default keeps it representable.
#ifndef PACKDEC_MAX_INPUT_LENGTH
#define PACKDEC_MAX_INPUT_LENGTH 4294967295ULL
#endif

inline constexpr std::uint64_t MAX_INPUT_LENGTH = PACKDEC_MAX_INPUT_LENGTH;

inline constexpr std::size_t DIGITS_PER_BYTE = 2U;
inline constexpr unsigned NIBBLE_BITS = 4U;
inline constexpr std::uint8_t NIBBLE_MASK = 0x0FU;

inline constexpr char DECIMAL_POINT = '.';
inline constexpr char PLUS_SIGN = '+';
inline constexpr char MINUS_SIGN = '-';

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define PACKDEC_NO_EXCEPTIONS=1 to drop the throwing API for embedded use.
 * @{
 */
#ifndef PACKDEC_NO_EXCEPTIONS
#define PACKDEC_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace packdec

#endif // PACKDEC_CONFIG_HPP
