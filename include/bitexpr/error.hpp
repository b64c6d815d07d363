/**
 * @file error.hpp
 * @brief bitexpr error handling.
 *
 * Every decoding, evaluation and encoding step reports an Error code.
 * The exception types mirror the codes one-to-one for callers that prefer
 * the throwing API (disabled with BITEXPR_NO_EXCEPTIONS=1).
 */

#ifndef BITEXPR_ERROR_HPP
#define BITEXPR_ERROR_HPP

#include "config.hpp"

#if !BITEXPR_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace bitexpr {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                     ///< Success
    InvalidArg = -1,            ///< Invalid argument or input text
    UnexpectedEndOfStream = -2, ///< A field needs more bits than remain
    FramingMismatch = -3,       ///< Sub-packets overran the declared bit count
    MalformedOperands = -4,     ///< Operator has an unusable number of operands
    Overflow = -5               ///< Value does not fit its wire field
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
    case Error::UnexpectedEndOfStream:
        return "Unexpected end of bit stream";
    case Error::FramingMismatch:
        return "Sub-packets exceed declared bit count";
    case Error::MalformedOperands:
        return "Malformed operator operands";
    case Error::Overflow:
        return "Field overflow";
    default:
        return "Unknown error";
    }
}

#if !BITEXPR_NO_EXCEPTIONS

/**
 * @brief Base exception for bitexpr errors.
 */
class BitexprException : public std::runtime_error {
public:
    explicit BitexprException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public BitexprException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : BitexprException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for a truncated bit stream.
 */
class UnexpectedEndOfStreamException : public BitexprException {
public:
    explicit UnexpectedEndOfStreamException(const std::string& message)
        : BitexprException(message, Error::UnexpectedEndOfStream) {}
};

/**
 * @brief Exception for bit-count framing overrun.
 */
class FramingMismatchException : public BitexprException {
public:
    explicit FramingMismatchException(const std::string& message)
        : BitexprException(message, Error::FramingMismatch) {}
};

/**
 * @brief Exception for operator arity errors found during evaluation.
 */
class MalformedOperandsException : public BitexprException {
public:
    explicit MalformedOperandsException(const std::string& message)
        : BitexprException(message, Error::MalformedOperands) {}
};

/**
 * @brief Exception for field overflow while encoding.
 */
class OverflowException : public BitexprException {
public:
    explicit OverflowException(const std::string& message)
        : BitexprException(message, Error::Overflow) {}
};

/**
 * @brief Throw the exception matching @p error.
 *
 * @param error Error code (must not be Error::Ok)
 * @param context Prefix for the exception message
 */
[[noreturn]] inline void throw_error(Error error, const std::string& context) {
    std::string message = context + ": " + error_string(error);
    switch (error) {
    case Error::UnexpectedEndOfStream:
        throw UnexpectedEndOfStreamException(message);
    case Error::FramingMismatch:
        throw FramingMismatchException(message);
    case Error::MalformedOperands:
        throw MalformedOperandsException(message);
    case Error::Overflow:
        throw OverflowException(message);
    case Error::InvalidArg:
        throw InvalidArgumentException(message);
    default:
        throw BitexprException(message, error);
    }
}

#endif // !BITEXPR_NO_EXCEPTIONS

} // namespace bitexpr

#endif // BITEXPR_ERROR_HPP
