#include "hash.hpp"
#include "errors.hpp"

#include <array>
#include <cstddef>

namespace {

// Little-endian 64-bit limbs.
template <size_t N>
using Limbs = std::array<uint64_t, N>;

// c must fit in 32 bits; each limb is multiplied as two 32-bit halves.
template <size_t N>
Limbs<N> mul_small(const Limbs<N>& x, uint32_t c) {
    Limbs<N> out{};
    uint64_t carry = 0;
    for (size_t i = 0; i < N; ++i) {
        const uint64_t lo = (x[i] & 0xffffffffULL) * c + carry;
        const uint64_t hi = (x[i] >> 32) * c + (lo >> 32);
        out[i] = (hi << 32) | (lo & 0xffffffffULL);
        carry = hi >> 32;
    }
    return out;
}

template <size_t N>
Limbs<N> shift_left(const Limbs<N>& x, unsigned shift) {
    Limbs<N> out{};
    const size_t word = shift / 64;
    const unsigned bit = shift % 64;
    for (size_t i = word; i < N; ++i) {
        const size_t src = i - word;
        uint64_t v = x[src] << bit;
        if (bit && src > 0) v |= x[src - 1] >> (64 - bit);
        out[i] = v;
    }
    return out;
}

template <size_t N>
void add_into(Limbs<N>& acc, const Limbs<N>& x) {
    uint64_t carry = 0;
    for (size_t i = 0; i < N; ++i) {
        const uint64_t a = acc[i];
        const uint64_t s = a + x[i];
        const uint64_t s2 = s + carry;
        carry = (s < a) || (s2 < s) ? 1 : 0;
        acc[i] = s2;
    }
}

// FNV-1a with prime = 2^prime_shift + prime_low, modulo 2^(64*N).
// Returns the low 64 bits, which fix the value mod any power of two up to 2^64.
template <size_t N>
uint64_t fnv1a_wide(const std::string& s, const Limbs<N>& basis,
                    unsigned prime_shift, uint32_t prime_low) {
    Limbs<N> h = basis;
    for (unsigned char c : s) {
        h[0] ^= c;
        Limbs<N> p = mul_small(h, prime_low);
        add_into(p, shift_left(h, prime_shift));
        h = p;
    }
    return h[0];
}

} // namespace

uint64_t Fnv1a32::operator()(const std::string& s) const {
    uint32_t h = 2166136261u;
    for (unsigned char c : s) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

uint64_t Fnv1a64::operator()(const std::string& s) const {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

uint64_t Fnv1a128::operator()(const std::string& s) const {
    static const Limbs<2> basis{0x62b821756295c58dULL, 0x6c62272e07bb0142ULL};
    return fnv1a_wide<2>(s, basis, 88, 0x13bu);
}

uint64_t Fnv1a256::operator()(const std::string& s) const {
    static const Limbs<4> basis{
        0x1023b4c8caee0535ULL, 0xc8b1536847b6bbb3ULL,
        0x2d98c384c4e576ccULL, 0xdd268dbcaac55036ULL};
    return fnv1a_wide<4>(s, basis, 168, 0x163u);
}

std::shared_ptr<const StringHash> make_string_hash(const std::string& name) {
    if (name == "fnv1a32") return std::make_shared<Fnv1a32>();
    if (name == "fnv1a64") return std::make_shared<Fnv1a64>();
    if (name == "fnv1a128") return std::make_shared<Fnv1a128>();
    if (name == "fnv1a256") return std::make_shared<Fnv1a256>();
    throw ConfigurationError("Unknown hash function: " + name);
}
