#ifndef QKDSIM_RECONCILIATION_H
#define QKDSIM_RECONCILIATION_H

#include "quantum/qkd_types.h"
#include "quantum/random_source.h"
#include "infrastructure/error_handling.h"
#include <optional>
#include <string>
#include <vector>

namespace qkdsim {
namespace quantum {

constexpr double SECURITY_HIGH_QBER = 0.05;
constexpr double SECURITY_MEDIUM_QBER = 0.15;

struct SiftedKey {
    std::vector<uint8_t> senderBits;
    std::vector<uint8_t> receiverBits;
    std::vector<size_t> positions;
    size_t discarded = 0;

    size_t size() const { return senderBits.size(); }
    bool operator==(const SiftedKey& other) const {
        return senderBits == other.senderBits && receiverBits == other.receiverBits &&
               positions == other.positions && discarded == other.discarded;
    }
};

struct ErrorEstimate {
    std::vector<size_t> disclosedIndices;
    size_t sampleSize = 0;
    size_t mismatches = 0;
    double qber = 0.0;
};

// E91 CHSH statistic. Settings are indexed (a0,b0) (a0,b1) (a1,b0) (a1,b1)
// with a in {0, 45} degrees and b in {22.5, 67.5} degrees.
struct BellTest {
    double s = 0.0;
    double correlation[4] = {0.0, 0.0, 0.0, 0.0};
    size_t samples[4] = {0, 0, 0, 0};
    bool complete = false;
};

struct ReconciliationResult {
    SiftedKey sifted;
    ErrorEstimate estimate;
    std::optional<BellTest> bell;
};

SiftedKey sift(const Transcript& transcript);

Result<ErrorEstimate> estimateError(const SiftedKey& sifted, double disclosedSampleFraction,
                                    RandomSource& rng, size_t minSiftedBits = DEFAULT_MIN_SIFTED_BITS);

std::vector<uint8_t> finalizeKey(const std::vector<uint8_t>& siftedBits,
                                 const std::vector<size_t>& disclosedIndices);

BellTest chshParameter(const Transcript& transcript);

const char* securityLevel(double qber);
double agreementRate(const SiftedKey& sifted);

std::vector<uint8_t> packBits(const std::vector<uint8_t>& bits);
std::string privacyAmplify(const std::vector<uint8_t>& finalKey);

std::string bitsToString(const std::vector<uint8_t>& bits);

}
}

#endif
