#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "hash.hpp"

// Explicit number of probes per item.
struct ProbeCount {
    uint32_t k;
};

// Expected number of distinct items; k = floor(size / n * ln 2).
struct ExpectedItems {
    uint64_t n;
};

// monostate => k = floor(log2(size)).
using ProbeConfig = std::variant<std::monostate, ProbeCount, ExpectedItems>;

// Bloom-style membership set over a fixed bit vector.
// Probe i of an item is (hash_a(item) + i * hash_b(item)) mod size.
// hash_b(item) mod size == 0 collapses every probe onto one bit; callers
// must supply distinct, well-mixed hashes.
// Not safe for concurrent insertion; concurrent readers are fine once
// insertion has stopped.
class ProbabilisticSet {
public:
    // Throws ConfigurationError on zero size, explicit k == 0, n == 0 or a null hash.
    ProbabilisticSet(uint64_t size_bits,
                     std::shared_ptr<const StringHash> hash_a,
                     std::shared_ptr<const StringHash> hash_b,
                     ProbeConfig config = {});

    void insert(const std::string& item);
    void insert_all(const std::vector<std::string>& items);

    template <typename It>
    void insert_all(It first, It last) {
        for (; first != last; ++first) insert(*first);
    }

    // No false negatives; false positives grow with load.
    bool contains(const std::string& item) const;

    // Fraction of the item's probe bits that are set. A match-strength
    // heuristic, not a calibrated probability. 1.0 iff contains(item).
    double confidence(const std::string& item) const;

    // Packed image of byte_size() bytes, MSB-first within each byte.
    std::vector<uint8_t> serialize() const;

    // Replaces every bit. Throws SerializationError unless image.size() == byte_size().
    void deserialize(const std::vector<uint8_t>& image);

    // Raw image to/from a file. I/O failures throw std::runtime_error.
    void save(const std::string& path) const;
    void load(const std::string& path);

    uint64_t size() const { return size_bits_; }
    uint32_t k() const { return k_; }
    uint64_t byte_size() const { return bits_.size(); }
    uint64_t count_set_bits() const;

    const StringHash& hash_a() const { return *hash_a_; }
    const StringHash& hash_b() const { return *hash_b_; }

private:
    uint64_t size_bits_{0};
    uint32_t k_{0};
    std::shared_ptr<const StringHash> hash_a_;
    std::shared_ptr<const StringHash> hash_b_;
    std::vector<uint8_t> bits_; // packed bits

    static uint32_t resolve_k(uint64_t size_bits, const ProbeConfig& config);

    template <typename Fn>
    void for_each_probe(const std::string& item, Fn&& fn) const;

    void set_bit(uint64_t idx);
    bool get_bit(uint64_t idx) const;
};
