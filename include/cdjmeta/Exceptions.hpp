#pragma once

#include <stdexcept>
#include <string>

namespace cdjmeta {

/**
 * Thrown when bytes read from a dbserver stream (or a cache entry holding
 * recorded dbserver messages) do not follow the framing rules, or when the
 * server answers with something other than what was asked for.
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/**
 * Thrown when a metadata cache file is not a usable cache archive, or when
 * the data being written into one is not shaped like a track list.
 */
class CacheFormatError : public std::runtime_error {
public:
    explicit CacheFormatError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/**
 * Thrown when an operation needs a component to be running and it is not.
 */
class IllegalStateError : public std::logic_error {
public:
    explicit IllegalStateError(const std::string& message)
        : std::logic_error(message)
    {
    }
};

} // namespace cdjmeta
