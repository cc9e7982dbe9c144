#pragma once

#include "export.h"
#include <stdexcept>
#include <string>

namespace bragi {

/**
 * @brief Base class for all errors raised by Bragi
 */
class BRAGI_API Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Malformed timestamp, subtitle block, configuration or JSON document
 *
 * The subtitle parser swallows this per block; a direct TimestampCodec::decode()
 * call surfaces it to the caller.
 */
class BRAGI_API FormatError : public Error {
public:
    explicit FormatError(const std::string& message) : Error(message) {}
};

/**
 * @brief Failure of an external collaborator (decoder, speech-to-text, model load,
 *        translation or synthesis backend)
 */
class BRAGI_API ExternalServiceError : public Error {
public:
    explicit ExternalServiceError(const std::string& message) : Error(message) {}
};

/**
 * @brief Failure to read or write a caller-supplied file
 */
class BRAGI_API ResourceError : public Error {
public:
    explicit ResourceError(const std::string& message) : Error(message) {}
};

/**
 * @brief Raised between segments once cancellation has been requested
 */
class BRAGI_API CancelledError : public Error {
public:
    CancelledError() : Error("Cancelled") {}
};

} // namespace bragi
