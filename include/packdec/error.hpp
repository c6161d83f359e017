/**
 * @file error.hpp
 * @brief packdec error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * The exception types are compiled out with PACKDEC_NO_EXCEPTIONS=1.
 */

#ifndef PACKDEC_ERROR_HPP
#define PACKDEC_ERROR_HPP

#include "config.hpp"

#if !PACKDEC_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace packdec {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,           ///< Success
    InvalidArg = -1,  ///< Invalid argument (e.g. nothing to pack)
    Overflow = -2,    ///< Input longer than MAX_INPUT_LENGTH
    Malformed = -3,   ///< Input is not a decimal literal
    InvalidDigit = -4 ///< Non-digit character reached the packer
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Input too long";
    case Error::Malformed:
        return "Malformed decimal literal";
    case Error::InvalidDigit:
        return "Invalid digit character";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Check whether an error is a rejection of the caller's input.
 *
 * Malformed and over-long literals are expected outcomes. Any other
 * failure from the parse pipeline is an internal invariant violation.
 */
constexpr bool is_input_error(Error error) noexcept {
    return error == Error::Malformed || error == Error::Overflow;
}

#if !PACKDEC_NO_EXCEPTIONS

/**
 * @brief Base exception for packdec errors.
 */
class PackdecException : public std::runtime_error {
public:
    explicit PackdecException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for input that fails the decimal grammar.
 */
class MalformedInputException : public PackdecException {
public:
    explicit MalformedInputException(const std::string& message)
        : PackdecException(message, Error::Malformed) {}
};

/**
 * @brief Exception for input longer than MAX_INPUT_LENGTH.
 */
class OverflowException : public PackdecException {
public:
    explicit OverflowException(const std::string& message)
        : PackdecException(message, Error::Overflow) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * @param error Failure code, not Error::Ok
 * @param message Exception message
 * @throws MalformedInputException for Error::Malformed
 * @throws OverflowException for Error::Overflow
 * @throws PackdecException carrying the code for anything else
 */
[[noreturn]] inline void throw_error(Error error, const std::string& message) {
    switch (error) {
    case Error::Malformed:
        throw MalformedInputException(message);
    case Error::Overflow:
        throw OverflowException(message);
    default:
        throw PackdecException(message, error);
    }
}

#endif // !PACKDEC_NO_EXCEPTIONS

} // namespace packdec

#endif // PACKDEC_ERROR_HPP
