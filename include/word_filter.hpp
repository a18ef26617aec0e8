#pragma once

#include <cstdint>

#include "probabilistic_set.hpp"

// Parameters shared by every word-list image; images are only readable
// by a set built with the same size, k and hash pair.
static constexpr uint64_t kWordFilterBits = 1ULL << 22;
static constexpr uint32_t kWordFilterProbes = 12;

// Empty set with the word-list parameters (FNV-1a-128 / FNV-1a-256).
ProbabilisticSet make_word_filter();
