#pragma once

#include <cstdint>
#include <memory>
#include <string>

// String -> unsigned integer hash. Must be deterministic.
class StringHash {
public:
    virtual ~StringHash() = default;

    virtual uint64_t operator()(const std::string& s) const = 0;
    virtual std::string name() const = 0;
};

class Fnv1a32 : public StringHash {
public:
    uint64_t operator()(const std::string& s) const override;
    std::string name() const override { return "fnv1a32"; }
};

class Fnv1a64 : public StringHash {
public:
    uint64_t operator()(const std::string& s) const override;
    std::string name() const override { return "fnv1a64"; }
};

// Wide variants run FNV-1a over 128/256-bit state and return its low 64 bits.
// Reduced mod a power of two this equals the full-width hash reduced the same way.
class Fnv1a128 : public StringHash {
public:
    uint64_t operator()(const std::string& s) const override;
    std::string name() const override { return "fnv1a128"; }
};

class Fnv1a256 : public StringHash {
public:
    uint64_t operator()(const std::string& s) const override;
    std::string name() const override { return "fnv1a256"; }
};

// "fnv1a32", "fnv1a64", "fnv1a128", "fnv1a256". Throws ConfigurationError otherwise.
std::shared_ptr<const StringHash> make_string_hash(const std::string& name);
