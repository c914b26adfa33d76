#include "quantum/random_source.h"
#include <algorithm>

namespace qkdsim {
namespace quantum {

RandomSource::RandomSource(uint64_t seed) : seed_(seed), rng_(seed) {}

uint64_t RandomSource::freshSeed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

uint64_t RandomSource::next() {
    return rng_();
}

uint8_t RandomSource::nextBit() {
    return static_cast<uint8_t>(rng_() >> 63);
}

double RandomSource::nextDouble() {
    return static_cast<double>(rng_() >> 11) * (1.0 / 9007199254740992.0);
}

bool RandomSource::bernoulli(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return nextDouble() < p;
}

size_t RandomSource::uniformIndex(size_t n) {
    if (n <= 1) return 0;
    // Lemire's multiply-shift over the high 32 bits; n stays far below 2^32 here.
    uint64_t hi = rng_() >> 32;
    return static_cast<size_t>((hi * static_cast<uint64_t>(n)) >> 32);
}

std::vector<size_t> RandomSource::sampleIndices(size_t n, size_t k) {
    k = std::min(k, n);
    std::vector<size_t> pool(n);
    for (size_t i = 0; i < n; i++) pool[i] = i;

    for (size_t i = 0; i < k; i++) {
        size_t j = i + uniformIndex(n - i);
        std::swap(pool[i], pool[j]);
    }

    std::vector<size_t> picked(pool.begin(), pool.begin() + k);
    std::sort(picked.begin(), picked.end());
    return picked;
}

}
}
