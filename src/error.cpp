/**
 * @file error.cpp
 * @brief Mapping from error codes to exceptions.
 */

#include <eventwire/error.hpp>

namespace eventwire {

void throw_on_error(Error error) {
    const char* message = error_string(error);
    switch (error) {
    case Error::Ok:
        return;
    case Error::InvalidFormat:
        throw FormatException(message);
    case Error::MultipleEntries:
        throw MultiEntryException(message);
    case Error::ExtractFailed:
        throw ExtractionException(message);
    case Error::SizeMismatch:
        throw SizeMismatchException(message);
    case Error::MissingField:
        throw ConstructionException(message);
    }
    throw EventwireException(message, error);
}

} // namespace eventwire
