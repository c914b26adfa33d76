#ifndef QKDSIM_QUANTUM_UNIT_H
#define QKDSIM_QUANTUM_UNIT_H

#include "quantum/qkd_types.h"
#include "quantum/random_source.h"
#include "infrastructure/error_handling.h"
#include <memory>
#include <cstdint>

namespace qkdsim {
namespace quantum {

struct PairCorrelation;

struct BellOutcome {
    uint8_t zBit = 0;
    uint8_t xBit = 0;

    uint8_t packed() const { return static_cast<uint8_t>((xBit << 1) | zBit); }
};

/**
 * A single qubit or one half of an entangled pair.
 *
 * Units are move-only: copying a quantum state is not possible, and a unit
 * becomes terminal after its one permitted measurement. Halves of a pair hold
 * a shared PairCorrelation descriptor; the statistics of the second
 * measurement are computed from the descriptor and the first outcome.
 */
class QuantumUnit {
public:
    QuantumUnit();
    ~QuantumUnit();

    QuantumUnit(QuantumUnit&& other) noexcept;
    QuantumUnit& operator=(QuantumUnit&& other) noexcept;
    QuantumUnit(const QuantumUnit&) = delete;
    QuantumUnit& operator=(const QuantumUnit&) = delete;

    static Result<QuantumUnit> prepare(uint8_t bit, Basis basis);

    Result<uint8_t> measure(Basis basis, RandomSource& rng);

    bool isMeasured() const { return measured_; }
    bool isPairHalf() const { return pair_ != nullptr; }

    friend struct EntangledPair;
    friend Result<BellOutcome> bellMeasure(QuantumUnit& message, QuantumUnit& half, RandomSource& rng);

private:
    QuantumUnit(std::shared_ptr<PairCorrelation> pair, int side);

    uint8_t bit_ = 0;
    Basis basis_ = Basis::RECTILINEAR;
    bool measured_ = false;
    std::shared_ptr<PairCorrelation> pair_;
    int side_ = 0;
};

struct EntangledPair {
    QuantumUnit first;
    QuantumUnit second;

    static EntangledPair create(PairKind correlation);
};

inline EntangledPair prepareEntangledPair(PairKind correlation) {
    return EntangledPair::create(correlation);
}

// Joint Bell-basis measurement of a message qubit and one pair half.
// Consumes both units and returns the two classical correction bits.
Result<BellOutcome> bellMeasure(QuantumUnit& message, QuantumUnit& half, RandomSource& rng);

// Receiver-side Pauli correction X^x Z^z of an outcome measured in basis.
uint8_t applyCorrection(uint8_t outcome, Basis basis, const BellOutcome& correction);

}
}

#endif
