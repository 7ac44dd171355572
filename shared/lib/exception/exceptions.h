/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exceptions raised while configuring a pinning client. Per-handshake
 * decisions never throw; they return result structs instead.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace certpin::common {

/**
 * @brief Base exception for all certpin exceptions
 */
class PinningException : public std::runtime_error {
public:
    explicit PinningException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration missing or invalid
 */
class ConfigException : public PinningException {
public:
    explicit ConfigException(const std::string& message)
        : PinningException("Configuration error: " + message) {}
};

/**
 * @brief Certificate or encoding could not be parsed
 */
class ParsingException : public PinningException {
public:
    explicit ParsingException(const std::string& message)
        : PinningException("Parsing error: " + message) {}
};

/**
 * @brief Transport (SSL_CTX/SSL) setup failed
 */
class TransportException : public PinningException {
public:
    explicit TransportException(const std::string& message)
        : PinningException("Transport error: " + message) {}
};

} // namespace certpin::common
