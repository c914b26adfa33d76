#include "quantum/protocol_engine.h"
#include "utils/logger.h"

namespace qkdsim {
namespace quantum {

// Alice analyzes at 0, 22.5 or 45 degrees and Bob at 22.5, 45 or 67.5.
// Equal settings (22.5/22.5 and 45/45) form the key; the crossed settings
// Alice{0,45} x Bob{22.5,67.5} feed the CHSH statistic.
static const Basis ALICE_ANGLES[3] = {Basis::RECTILINEAR, Basis::ANGLE_22_5, Basis::DIAGONAL};
static const Basis BOB_ANGLES[3] = {Basis::ANGLE_22_5, Basis::DIAGONAL, Basis::ANGLE_67_5};

E91Engine::E91Engine(const SimulationConfig& config, uint64_t seed)
    : EntangledPairEngine(Protocol::E91, config, seed) {}

Basis E91Engine::chooseAliceBasis() {
    return ALICE_ANGLES[rng().uniformIndex(3)];
}

Basis E91Engine::chooseBobBasis() {
    return BOB_ANGLES[rng().uniformIndex(3)];
}

void E91Engine::analyzeTranscript(ReconciliationResult& result) {
    BellTest bell = chshParameter(transcript());
    if (!bell.complete) {
        LOG_WARN("E91 run has too few rounds to fill every CHSH setting");
    }
    LOG_DEBUG("E91 CHSH S = " + std::to_string(bell.s));
    result.bell = bell;
}

}
}
