#pragma once

/**
 * @file errors.h
 * @brief Exception types raised by the refinement engine and its collaborators
 *
 * All engine failures are deterministic: retrying with the same inputs fails
 * the same way, so callers should surface them rather than retry.
 */

#include <stdexcept>
#include <string>

namespace tessera {

/// @brief Base class for all tessera errors
class TesseraError : public std::runtime_error {
public:
    explicit TesseraError(const std::string& what) : std::runtime_error(what) {}
};

/// @brief A region enclosing zero pixels was passed to computeStats()
class EmptyRegionError : public TesseraError {
public:
    explicit EmptyRegionError(const std::string& what) : TesseraError(what) {}
};

/// @brief A null, zero-dimension or malformed pixel buffer
class InvalidBufferError : public TesseraError {
public:
    explicit InvalidBufferError(const std::string& what) : TesseraError(what) {}
};

/// @brief selectSource() was called with an identifier that has no buffer
class UnknownSourceError : public TesseraError {
public:
    explicit UnknownSourceError(const std::string& what) : TesseraError(what) {}
};

/// @brief Configuration file or value could not be used
class ConfigError : public TesseraError {
public:
    explicit ConfigError(const std::string& what) : TesseraError(what) {}
};

} // namespace tessera
