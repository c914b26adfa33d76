#ifndef QKDSIM_EAVESDROPPER_H
#define QKDSIM_EAVESDROPPER_H

#include "quantum/quantum_unit.h"
#include <vector>

namespace qkdsim {
namespace quantum {

struct Interception {
    bool intercepted = false;
    Basis basis = Basis::RECTILINEAR;
    uint8_t observedBit = 0;
};

/**
 * Intercept-resend adversary. With the configured probability it measures
 * the in-transit unit in a uniformly chosen conjugate basis and forwards a
 * fresh unit carrying what it saw. It never learns the parties' bases.
 */
class Eavesdropper {
public:
    explicit Eavesdropper(double interceptProbability);

    double interceptProbability() const { return interceptProbability_; }

    // Replaces unit in place when the attack fires.
    Result<Interception> intercept(QuantumUnit& unit, RandomSource& rng);

    const std::vector<Interception>& observations() const { return observations_; }
    size_t interceptCount() const { return observations_.size(); }
    size_t passedCount() const { return passed_; }

private:
    double interceptProbability_;
    std::vector<Interception> observations_;
    size_t passed_ = 0;
};

}
}

#endif
