#include "quantum/protocol_engine.h"

namespace qkdsim {
namespace quantum {

BBM92Engine::BBM92Engine(const SimulationConfig& config, uint64_t seed)
    : EntangledPairEngine(Protocol::BBM92, config, seed) {}

Basis BBM92Engine::chooseAliceBasis() {
    return rng().nextBit() ? Basis::DIAGONAL : Basis::RECTILINEAR;
}

Basis BBM92Engine::chooseBobBasis() {
    return rng().nextBit() ? Basis::DIAGONAL : Basis::RECTILINEAR;
}

}
}
