#pragma once

#include <stdexcept>
#include <string>

class PetalError : public std::runtime_error {
public:
    explicit PetalError(const std::string& what) : std::runtime_error(what) {}
};

// Bad construction parameters: zero size, zero k, zero expected items, missing hash.
class ConfigurationError : public PetalError {
public:
    explicit ConfigurationError(const std::string& what) : PetalError(what) {}
};

// Packed bit image does not match the structure's bit count.
class SerializationError : public PetalError {
public:
    explicit SerializationError(const std::string& what) : PetalError(what) {}
};
