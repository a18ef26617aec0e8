#include "probabilistic_set.hpp"
#include "errors.hpp"

#include <bitset>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

ProbabilisticSet::ProbabilisticSet(uint64_t size_bits,
                                   std::shared_ptr<const StringHash> hash_a,
                                   std::shared_ptr<const StringHash> hash_b,
                                   ProbeConfig config)
    : size_bits_(size_bits),
      hash_a_(std::move(hash_a)),
      hash_b_(std::move(hash_b))
{
    if (size_bits_ == 0) throw ConfigurationError("Bit vector size must be positive");
    if (!hash_a_ || !hash_b_) throw ConfigurationError("Both hash functions are required");

    k_ = resolve_k(size_bits_, config);

    const uint64_t nbytes = size_bits_ / 8 + (size_bits_ % 8 != 0);
    bits_.assign(nbytes, 0);
}

uint32_t ProbabilisticSet::resolve_k(uint64_t size_bits, const ProbeConfig& config) {
    uint64_t k = 0;
    if (const auto* explicit_k = std::get_if<ProbeCount>(&config)) {
        if (explicit_k->k == 0) throw ConfigurationError("Probe count k must be positive");
        return explicit_k->k;
    } else if (const auto* expected = std::get_if<ExpectedItems>(&config)) {
        if (expected->n == 0) throw ConfigurationError("Expected item count must be positive");
        const double derived = std::floor(static_cast<double>(size_bits) /
                                          static_cast<double>(expected->n) * std::log(2.0));
        const double cap = static_cast<double>(std::numeric_limits<uint32_t>::max());
        k = static_cast<uint64_t>(derived < cap ? derived : cap);
    } else {
        // floor(log2(size)), exact on integers
        while ((size_bits >> k) > 1) ++k;
    }

    // n > size (or size == 1) would give zero probes
    if (k == 0) k = 1;
    return static_cast<uint32_t>(k);
}

template <typename Fn>
void ProbabilisticSet::for_each_probe(const std::string& item, Fn&& fn) const {
    // (h1 + i*h2) mod size, stepped without wraparound
    const uint64_t step = (*hash_b_)(item) % size_bits_;
    uint64_t pos = (*hash_a_)(item) % size_bits_;

    for (uint32_t i = 0; i < k_; ++i) {
        if (!fn(pos)) return;
        pos += step;
        if (pos >= size_bits_ || pos < step) pos -= size_bits_;
    }
}

void ProbabilisticSet::set_bit(uint64_t idx) {
    bits_[idx / 8] |= static_cast<uint8_t>(0x80u >> (idx % 8));
}

bool ProbabilisticSet::get_bit(uint64_t idx) const {
    return (bits_[idx / 8] & static_cast<uint8_t>(0x80u >> (idx % 8))) != 0;
}

void ProbabilisticSet::insert(const std::string& item) {
    for_each_probe(item, [this](uint64_t idx) {
        set_bit(idx);
        return true;
    });
}

void ProbabilisticSet::insert_all(const std::vector<std::string>& items) {
    insert_all(items.begin(), items.end());
}

bool ProbabilisticSet::contains(const std::string& item) const {
    bool all = true;
    for_each_probe(item, [&](uint64_t idx) {
        all = get_bit(idx);
        return all;
    });
    return all;
}

double ProbabilisticSet::confidence(const std::string& item) const {
    uint32_t hits = 0;
    for_each_probe(item, [&](uint64_t idx) {
        if (get_bit(idx)) ++hits;
        return true;
    });
    return static_cast<double>(hits) / static_cast<double>(k_);
}

uint64_t ProbabilisticSet::count_set_bits() const {
    uint64_t n = 0;
    for (uint8_t b : bits_) n += std::bitset<8>(b).count();
    return n;
}

std::vector<uint8_t> ProbabilisticSet::serialize() const {
    return bits_;
}

void ProbabilisticSet::deserialize(const std::vector<uint8_t>& image) {
    if (image.size() != bits_.size()) {
        throw SerializationError("Bit image holds " + std::to_string(image.size()) +
                                 " bytes, expected " + std::to_string(bits_.size()) +
                                 " for " + std::to_string(size_bits_) + " bits");
    }

    bits_ = image;

    // padding past size_bits_ stays zero
    const unsigned tail = static_cast<unsigned>(size_bits_ % 8);
    if (tail) bits_.back() &= static_cast<uint8_t>(0xFFu << (8 - tail));
}

void ProbabilisticSet::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("Failed to open bit image file: " + path);

    if (!bits_.empty()) out.write(reinterpret_cast<const char*>(bits_.data()),
                                  static_cast<std::streamsize>(bits_.size()));
    out.flush();
    if (!out) throw std::runtime_error("Failed to write bit image file: " + path);
}

void ProbabilisticSet::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("Failed to open bit image file: " + path);

    std::vector<uint8_t> image((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) throw std::runtime_error("Failed to read bit image file: " + path);

    deserialize(image);
}
