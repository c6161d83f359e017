/**
 * @file packdec.hpp
 * @brief packdec public API.
 *
 * Converts decimal literals such as "-99084.566" into a sign tag, a scale
 * and BCD-style packed digits. Include this header for the whole library.
 */

#ifndef PACKDEC_HPP
#define PACKDEC_HPP

#include "config.hpp"
#include "decimal.hpp"
#include "decomposer.hpp"
#include "error.hpp"
#include "packer.hpp"
#include "sign.hpp"
#include "validator.hpp"

namespace packdec {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace packdec

#endif // PACKDEC_HPP
