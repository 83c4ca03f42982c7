/**
 * @file error.hpp
 * @brief lazybits error handling.
 *
 * Every failure is reported as an exception derived from LazyBitsException,
 * carrying an Error code. Decode-time failures share the DecodingException
 * base so a caller that triggers a deferred decode can catch them uniformly.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_ERROR_HPP
#define LAZYBITS_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace lazybits {

/**
 * @brief Error codes carried by every lazybits exception.
 */
enum class Error {
    Ok = 0,             ///< Success
    InvalidArg = -1,    ///< Invalid argument
    Overflow = -2,      ///< Cursor moved past the end of the buffer
    Underflow = -3,     ///< Buffer underflow (not enough data)
    InvalidData = -4,   ///< Invalid/corrupted data
    Unresolved = -5,    ///< Reference or size could not be resolved
    Configuration = -6  ///< Codec setup rejected
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
        return "Buffer overflow";
    case Error::Underflow:
        return "Buffer underflow";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    case Error::Unresolved:
        return "Unresolved reference";
    case Error::Configuration:
        return "Invalid codec configuration";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for lazybits errors.
 */
class LazyBitsException : public std::runtime_error {
public:
    explicit LazyBitsException(const std::string& message, Error code = Error::InvalidArg)
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
class InvalidArgumentException : public LazyBitsException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : LazyBitsException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for codec setup that cannot work, raised when the codec
 * tree is built rather than when data is decoded.
 */
class ConfigurationException : public LazyBitsException {
public:
    explicit ConfigurationException(const std::string& message)
        : LazyBitsException(message, Error::Configuration) {}
};

/**
 * @brief Base exception for failures while decoding a buffer.
 */
class DecodingException : public LazyBitsException {
public:
    explicit DecodingException(const std::string& message, Error code = Error::InvalidData)
        : LazyBitsException(message, code) {}
};

/**
 * @brief Exception for moving the cursor past the end of the buffer.
 */
class OverflowException : public DecodingException {
public:
    explicit OverflowException(const std::string& message)
        : DecodingException(message, Error::Overflow) {}
};

/**
 * @brief Exception for buffer underflow.
 */
class UnderflowException : public DecodingException {
public:
    explicit UnderflowException(const std::string& message)
        : DecodingException(message, Error::Underflow) {}
};

/**
 * @brief Exception for invalid/corrupted data.
 */
class InvalidDataException : public DecodingException {
public:
    explicit InvalidDataException(const std::string& message)
        : DecodingException(message, Error::InvalidData) {}
};

/**
 * @brief Exception for a name the resolver has no binding for.
 */
class UnresolvedReferenceException : public DecodingException {
public:
    explicit UnresolvedReferenceException(const std::string& name)
        : DecodingException("Unresolved reference: " + name, Error::Unresolved), name_(name) {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief Exception for a codec that cannot determine its size.
 */
class SizeResolutionException : public DecodingException {
public:
    explicit SizeResolutionException(const std::string& message)
        : DecodingException(message, Error::Unresolved) {}
};

} // namespace lazybits

#endif // LAZYBITS_ERROR_HPP
