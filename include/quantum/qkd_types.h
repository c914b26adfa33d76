#ifndef QKDSIM_QKD_TYPES_H
#define QKDSIM_QKD_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace qkdsim {
namespace quantum {

constexpr double DEFAULT_QBER_THRESHOLD = 0.11;
constexpr double DEFAULT_SAMPLE_FRACTION = 0.1;
constexpr size_t DEFAULT_MIN_SIFTED_BITS = 1;
constexpr int64_t DEFAULT_QUBIT_COUNT = 1000;
constexpr int64_t MAX_QUBIT_COUNT = 1000000;

enum class Protocol {
    BB84,
    E91,
    BBM92,
    TELEPORTATION
};

// Polarization measurement bases. The underlying value is the analyzer
// angle in steps of 22.5 degrees.
enum class Basis : uint8_t {
    RECTILINEAR = 0,
    ANGLE_22_5 = 1,
    DIAGONAL = 2,
    ANGLE_67_5 = 3
};

enum class PairKind {
    CORRELATED,
    ANTI_CORRELATED
};

enum class RunState {
    INIT,
    PREPARING,
    TRANSMITTING,
    DISCLOSING_BASES,
    SIFTING,
    ESTIMATING_ERROR,
    ACCEPTED,
    REJECTED
};

struct SimulationConfig {
    Protocol protocol = Protocol::BB84;
    int64_t qubitCount = DEFAULT_QUBIT_COUNT;
    double eavesdropProbability = 0.0;
    double channelNoiseProbability = 0.0;
    double channelLossProbability = 0.0;
    double disclosedSampleFraction = DEFAULT_SAMPLE_FRACTION;
    double qberThreshold = DEFAULT_QBER_THRESHOLD;
    size_t minSiftedBits = DEFAULT_MIN_SIFTED_BITS;
    std::optional<uint64_t> seed;
    std::string customBits;
    Basis teleportationBasis = Basis::RECTILINEAR;
    bool includeTranscript = false;
};

// One unit's transit. receiverBit is already in key convention, i.e.
// complemented by the receiver for anti-correlated pairs and corrected
// for teleportation.
struct ChannelEvent {
    size_t index = 0;
    Basis senderBasis = Basis::RECTILINEAR;
    uint8_t senderBit = 0;
    bool intercepted = false;
    Basis eveBasis = Basis::RECTILINEAR;
    uint8_t eveBit = 0;
    Basis receiverBasis = Basis::RECTILINEAR;
    uint8_t receiverBit = 0;
    bool noiseFlipped = false;
    bool lost = false;
    uint8_t correction = 0;
    bool correctionAuthenticated = true;
};

struct Transcript {
    Protocol protocol = Protocol::BB84;
    std::vector<ChannelEvent> events;
};

const char* protocolToString(Protocol protocol);
bool parseProtocol(const std::string& name, Protocol& out);
const char* basisToString(Basis basis);
bool parseBasis(const std::string& name, Basis& out);
const char* runStateToString(RunState state);

inline int basisAngleSteps(Basis basis) { return static_cast<int>(basis); }
inline bool isConjugateBasis(Basis basis) {
    return basis == Basis::RECTILINEAR || basis == Basis::DIAGONAL;
}

}
}

#endif
