#ifndef QKDSIM_RANDOM_SOURCE_H
#define QKDSIM_RANDOM_SOURCE_H

#include <random>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace qkdsim {
namespace quantum {

/**
 * Per-run pseudo-random source. Every component that needs randomness takes
 * a reference to one of these; nothing draws from global state. All values
 * are derived from the raw engine output so that a seed replays a run
 * bit-for-bit regardless of the standard library in use.
 */
class RandomSource {
public:
    explicit RandomSource(uint64_t seed);

    static uint64_t freshSeed();

    uint64_t seed() const { return seed_; }

    uint64_t next();
    uint8_t nextBit();
    double nextDouble();
    bool bernoulli(double p);
    size_t uniformIndex(size_t n);

    // k distinct indices from [0, n), ascending.
    std::vector<size_t> sampleIndices(size_t n, size_t k);

private:
    uint64_t seed_;
    std::mt19937_64 rng_;
};

}
}

#endif
