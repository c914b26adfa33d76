#include "quantum/eavesdropper.h"

namespace qkdsim {
namespace quantum {

Eavesdropper::Eavesdropper(double interceptProbability)
    : interceptProbability_(interceptProbability) {}

Result<Interception> Eavesdropper::intercept(QuantumUnit& unit, RandomSource& rng) {
    Interception obs;
    if (!rng.bernoulli(interceptProbability_)) {
        passed_++;
        return obs;
    }

    obs.basis = rng.nextBit() ? Basis::DIAGONAL : Basis::RECTILINEAR;
    auto measured = unit.measure(obs.basis, rng);
    if (measured.failed()) return measured.error();
    obs.observedBit = measured.value();

    auto resent = QuantumUnit::prepare(obs.observedBit, obs.basis);
    if (resent.failed()) return resent.error();
    unit = std::move(resent.value());

    obs.intercepted = true;
    observations_.push_back(obs);
    return obs;
}

}
}
