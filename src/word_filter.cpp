#include "word_filter.hpp"

#include <memory>

ProbabilisticSet make_word_filter() {
    return ProbabilisticSet(kWordFilterBits,
                            std::make_shared<Fnv1a128>(),
                            std::make_shared<Fnv1a256>(),
                            ProbeCount{kWordFilterProbes});
}
