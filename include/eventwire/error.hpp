/**
 * @file error.hpp
 * @brief eventwire error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * Decompression functions report an Error tag; the throwing convenience
 * wrappers and Event construction raise the matching exception type.
 */

#ifndef EVENTWIRE_ERROR_HPP
#define EVENTWIRE_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace eventwire {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,               ///< Success
    InvalidFormat = -1,   ///< Buffer does not match the container format
    MultipleEntries = -2, ///< Zip archive holds more than one entry
    ExtractFailed = -3,   ///< Archive entry could not be decoded
    SizeMismatch = -4,    ///< Decoded length differs from the recorded size
    MissingField = -5     ///< Event built without a required field
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
    case Error::InvalidFormat:
        return "Data is not in the expected compressed format";
    case Error::MultipleEntries:
        return "Zip archives containing multiple files are not supported";
    case Error::ExtractFailed:
        return "Failed to extract zip entry";
    case Error::SizeMismatch:
        return "Extracted size does not match recorded size";
    case Error::MissingField:
        return "Event is missing a required field";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for eventwire errors.
 */
class EventwireException : public std::runtime_error {
public:
    explicit EventwireException(const std::string& message, Error code = Error::InvalidFormat)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Buffer does not match the claimed container signature or structure.
 */
class FormatException : public EventwireException {
public:
    explicit FormatException(const std::string& message)
        : EventwireException(message, Error::InvalidFormat) {}
};

/**
 * @brief Zip archive contains more than one entry.
 */
class MultiEntryException : public EventwireException {
public:
    explicit MultiEntryException(const std::string& message)
        : EventwireException(message, Error::MultipleEntries) {}
};

/**
 * @brief Single zip entry could not be decoded.
 */
class ExtractionException : public EventwireException {
public:
    explicit ExtractionException(const std::string& message)
        : EventwireException(message, Error::ExtractFailed) {}
};

/**
 * @brief Decoded length differs from the archive's recorded size.
 */
class SizeMismatchException : public EventwireException {
public:
    explicit SizeMismatchException(const std::string& message)
        : EventwireException(message, Error::SizeMismatch) {}
};

/**
 * @brief Event built without a required field.
 */
class ConstructionException : public EventwireException {
public:
    explicit ConstructionException(const std::string& message)
        : EventwireException(message, Error::MissingField) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code
 */
void throw_on_error(Error error);

} // namespace eventwire

#endif // EVENTWIRE_ERROR_HPP
