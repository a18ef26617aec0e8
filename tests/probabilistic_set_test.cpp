#include "errors.hpp"
#include "probabilistic_set.hpp"

#include <cassert>
#include <limits>
#include <memory>
#include <string>
#include <vector>

// Returns the same value for every input, so probe positions are known.
class FixedHash : public StringHash {
public:
    explicit FixedHash(uint64_t v) : v_(v) {}
    uint64_t operator()(const std::string&) const override { return v_; }
    std::string name() const override { return "fixed"; }

private:
    uint64_t v_;
};

static std::shared_ptr<const StringHash> fixed(uint64_t v) {
    return std::make_shared<FixedHash>(v);
}

static ProbabilisticSet fnv_set(uint64_t size_bits, ProbeConfig config) {
    return ProbabilisticSet(size_bits, std::make_shared<Fnv1a64>(),
                            std::make_shared<Fnv1a32>(), config);
}

template <typename E, typename Fn>
static bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

int main() {
    // k derivation
    {
        assert(fnv_set(1024, ExpectedItems{100}).k() == 7);
        assert(fnv_set(1024, ProbeConfig{}).k() == 10);
        assert(fnv_set(1000, ProbeConfig{}).k() == 9);
        assert(fnv_set(1024, ProbeCount{3}).k() == 3);

        // pathological inputs floor to one probe
        assert(fnv_set(1024, ExpectedItems{5000}).k() == 1);
        assert(fnv_set(1, ProbeConfig{}).k() == 1);
    }

    // Configuration errors
    {
        assert(throws<ConfigurationError>([] { fnv_set(0, ProbeCount{4}); }));
        assert(throws<ConfigurationError>([] { fnv_set(0, ProbeConfig{}); }));
        assert(throws<ConfigurationError>([] { fnv_set(64, ProbeCount{0}); }));
        assert(throws<ConfigurationError>([] { fnv_set(64, ExpectedItems{0}); }));
        assert(throws<ConfigurationError>([] {
            ProbabilisticSet s(64, nullptr, std::make_shared<Fnv1a32>());
        }));
        assert(throws<PetalError>([] { fnv_set(0, ProbeCount{4}); }));
    }

    // Sizing
    {
        assert(fnv_set(64, ProbeCount{4}).byte_size() == 8);
        assert(fnv_set(65, ProbeCount{4}).byte_size() == 9);
        assert(fnv_set(1, ProbeCount{4}).byte_size() == 1);
        assert(fnv_set(65, ProbeCount{4}).count_set_bits() == 0);
    }

    // Probe positions: (h1 + i*h2) mod size
    {
        ProbabilisticSet s(10, fixed(7), fixed(5), ProbeCount{4});
        s.insert("anything");
        // 7, 2, 7, 2
        assert(s.count_set_bits() == 2);
        assert(s.serialize() == std::vector<uint8_t>({0x21, 0x00}));
    }

    // Large hash values reduce exactly, without 64-bit wraparound
    {
        const uint64_t max = std::numeric_limits<uint64_t>::max(); // = 615 mod 1000
        ProbabilisticSet a(1000, fixed(max), fixed(max), ProbeCount{3});
        ProbabilisticSet b(1000, fixed(615), fixed(615), ProbeCount{3});
        a.insert("x");
        b.insert("x");
        assert(a.count_set_bits() == 3);
        assert(a.serialize() == b.serialize());
    }

    // h2 == 0 mod size collapses every probe onto h1
    {
        ProbabilisticSet s(16, fixed(3), fixed(32), ProbeCount{8});
        s.insert("x");
        assert(s.count_set_bits() == 1);
        assert(s.contains("y"));
    }

    // Confidence is quantized to hits / k
    {
        ProbabilisticSet s(64, fixed(0), fixed(1), ProbeCount{8});
        std::vector<uint8_t> image(8, 0);
        image[0] = 0xE0; // bits 0, 1, 2 (MSB-first)
        s.deserialize(image);
        assert(s.confidence("never inserted") == 0.375);
        assert(!s.contains("never inserted"));

        image[0] = 0x00;
        s.deserialize(image);
        assert(s.confidence("never inserted") == 0.0);

        image[0] = 0xFF;
        s.deserialize(image);
        assert(s.confidence("never inserted") == 1.0);
        assert(s.contains("never inserted"));
    }

    // No false negatives, monotonic fill and confidence
    {
        ProbabilisticSet s = fnv_set(4096, ExpectedItems{200});
        const std::string probe = "probe-word";
        uint64_t last_count = 0;
        double last_conf = s.confidence(probe);
        assert(last_conf == 0.0);

        std::vector<std::string> inserted;
        for (int i = 0; i < 300; i++) {
            inserted.push_back("word" + std::to_string(i));
            s.insert(inserted.back());

            assert(s.count_set_bits() >= last_count);
            last_count = s.count_set_bits();

            const double c = s.confidence(probe);
            assert(c >= last_conf);
            last_conf = c;
        }
        for (const auto& w : inserted) {
            assert(s.contains(w));
            assert(s.confidence(w) == 1.0);
        }
    }

    // Idempotence
    {
        ProbabilisticSet once = fnv_set(2048, ProbeCount{6});
        ProbabilisticSet twice = fnv_set(2048, ProbeCount{6});
        once.insert("mustard");
        twice.insert("mustard");
        twice.insert("mustard");
        assert(once.serialize() == twice.serialize());
    }

    // insert_all is order-independent and matches single inserts
    {
        std::vector<std::string> items = {"mustard", "ketchup", "skibidi", "relish"};
        ProbabilisticSet a = fnv_set(2048, ProbeCount{6});
        ProbabilisticSet b = fnv_set(2048, ProbeCount{6});
        ProbabilisticSet c = fnv_set(2048, ProbeCount{6});
        a.insert_all(items);
        b.insert_all(items.rbegin(), items.rend());
        for (const auto& i : items) c.insert(i);
        assert(a.serialize() == b.serialize());
        assert(a.serialize() == c.serialize());
        assert(a.contains("ketchup"));
    }

    // Round-trip through the packed image
    {
        ProbabilisticSet a = fnv_set(1001, ProbeCount{5});
        a.insert_all(std::vector<std::string>{"alpha", "beta", "gamma", "delta"});
        const auto image = a.serialize();
        assert(image.size() == 126);
        assert((image.back() & 0x7F) == 0); // 1001 = 125*8 + 1, rest is padding

        ProbabilisticSet b = fnv_set(1001, ProbeCount{5});
        b.deserialize(image);
        const char* probes[] = {"alpha", "beta", "gamma", "delta", "epsilon", "zeta", ""};
        for (const char* p : probes) {
            assert(a.contains(p) == b.contains(p));
            assert(a.confidence(p) == b.confidence(p));
        }
        assert(b.serialize() == image);
    }

    // Deserialize replaces rather than merges, and clears padding bits
    {
        ProbabilisticSet s = fnv_set(12, ProbeCount{2});
        s.insert("x");
        s.deserialize({0x00, 0xFF});
        assert(s.serialize() == std::vector<uint8_t>({0x00, 0xF0}));
        assert(s.count_set_bits() == 4);
    }

    // Wrong image length leaves the set untouched
    {
        ProbabilisticSet s = fnv_set(64, ProbeCount{3});
        s.insert("kept");
        const auto before = s.serialize();

        assert(throws<SerializationError>([&] { s.deserialize(std::vector<uint8_t>(7, 0xFF)); }));
        assert(throws<SerializationError>([&] { s.deserialize(std::vector<uint8_t>(9, 0xFF)); }));
        assert(throws<SerializationError>([&] { s.deserialize({}); }));
        assert(s.serialize() == before);
        assert(s.contains("kept"));
    }

    return 0;
}
