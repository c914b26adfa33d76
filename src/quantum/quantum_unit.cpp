#include "quantum/quantum_unit.h"
#include <cmath>
#include <string>

namespace qkdsim {
namespace quantum {

struct PairCorrelation {
    enum class Stage {
        INTACT,
        COLLAPSED,
        TELEPORTED
    };

    PairKind correlation = PairKind::CORRELATED;
    Stage stage = Stage::INTACT;

    // COLLAPSED: the first half measured and what it saw.
    int measuredSide = -1;
    Basis firstBasis = Basis::RECTILINEAR;
    uint8_t firstOutcome = 0;

    // TELEPORTED: the remaining half now carries this definite state.
    Basis resolvedBasis = Basis::RECTILINEAR;
    uint8_t resolvedBit = 0;

    uint8_t antiFlip() const { return correlation == PairKind::ANTI_CORRELATED ? 1 : 0; }
};

namespace {

constexpr double STEP_RADIANS = 3.14159265358979323846 / 8.0;

// Returns reference with probability cos^2(delta * 22.5 deg), otherwise its
// complement. Exact cases draw nothing (aligned, orthogonal) or a single fair
// bit (45 degrees), so conjugate-basis protocols never depend on rounding.
uint8_t projectOutcome(uint8_t reference, int deltaSteps, RandomSource& rng) {
    int d = ((deltaSteps % 8) + 8) % 8;
    if (d == 0) return reference;
    if (d == 4) return reference ^ 1;
    if (d == 2 || d == 6) return reference ^ rng.nextBit();

    double c = std::cos(d * STEP_RADIANS);
    return rng.bernoulli(c * c) ? reference : static_cast<uint8_t>(reference ^ 1);
}

// Definite single-qubit state the given half is in, if any.
bool definiteHalfState(const PairCorrelation& pc, int side, Basis& basis, uint8_t& bit) {
    if (pc.stage == PairCorrelation::Stage::COLLAPSED && pc.measuredSide != side) {
        basis = pc.firstBasis;
        bit = pc.firstOutcome ^ pc.antiFlip();
        return true;
    }
    if (pc.stage == PairCorrelation::Stage::TELEPORTED) {
        basis = pc.resolvedBasis;
        bit = pc.resolvedBit;
        return true;
    }
    return false;
}

}

QuantumUnit::QuantumUnit() : measured_(true) {}

QuantumUnit::QuantumUnit(std::shared_ptr<PairCorrelation> pair, int side)
    : measured_(false), pair_(std::move(pair)), side_(side) {}

QuantumUnit::~QuantumUnit() = default;

QuantumUnit::QuantumUnit(QuantumUnit&& other) noexcept
    : bit_(other.bit_), basis_(other.basis_), measured_(other.measured_),
      pair_(std::move(other.pair_)), side_(other.side_) {
    other.measured_ = true;
}

QuantumUnit& QuantumUnit::operator=(QuantumUnit&& other) noexcept {
    if (this != &other) {
        bit_ = other.bit_;
        basis_ = other.basis_;
        measured_ = other.measured_;
        pair_ = std::move(other.pair_);
        side_ = other.side_;
        other.measured_ = true;
    }
    return *this;
}

Result<QuantumUnit> QuantumUnit::prepare(uint8_t bit, Basis basis) {
    if (!isConjugateBasis(basis)) {
        return makeError(ErrorCode::INVALID_BASIS,
                         std::string("cannot prepare a qubit in basis ") + basisToString(basis));
    }
    if (bit > 1) {
        return makeError(ErrorCode::INVALID_PROTOCOL_PARAMETERS,
                         "prepared bit must be 0 or 1, got " + std::to_string(bit));
    }

    QuantumUnit unit;
    unit.bit_ = bit;
    unit.basis_ = basis;
    unit.measured_ = false;
    return std::move(unit);
}

Result<uint8_t> QuantumUnit::measure(Basis basis, RandomSource& rng) {
    if (measured_) {
        return makeError(ErrorCode::ALREADY_MEASURED, "quantum unit has already been measured");
    }
    measured_ = true;

    if (!pair_) {
        return projectOutcome(bit_, basisAngleSteps(basis) - basisAngleSteps(basis_), rng);
    }

    std::shared_ptr<PairCorrelation> pc = std::move(pair_);
    Basis definiteBasis;
    uint8_t definiteBit;
    if (definiteHalfState(*pc, side_, definiteBasis, definiteBit)) {
        return projectOutcome(definiteBit, basisAngleSteps(basis) - basisAngleSteps(definiteBasis), rng);
    }

    uint8_t outcome = rng.nextBit();
    pc->stage = PairCorrelation::Stage::COLLAPSED;
    pc->measuredSide = side_;
    pc->firstBasis = basis;
    pc->firstOutcome = outcome;
    return outcome;
}

EntangledPair EntangledPair::create(PairKind correlation) {
    auto pc = std::make_shared<PairCorrelation>();
    pc->correlation = correlation;
    EntangledPair pair;
    pair.first = QuantumUnit(pc, 0);
    pair.second = QuantumUnit(pc, 1);
    return pair;
}

Result<BellOutcome> bellMeasure(QuantumUnit& message, QuantumUnit& half, RandomSource& rng) {
    if (message.measured_ || half.measured_) {
        return makeError(ErrorCode::ALREADY_MEASURED, "Bell measurement on a consumed unit");
    }
    if (message.pair_ || !half.pair_) {
        return makeError(ErrorCode::INVALID_STATE,
                         "Bell measurement needs a single message qubit and one pair half");
    }

    message.measured_ = true;
    half.measured_ = true;
    std::shared_ptr<PairCorrelation> pc = std::move(half.pair_);

    BellOutcome out;
    Basis halfBasis;
    uint8_t halfBit;
    if (!definiteHalfState(*pc, half.side_, halfBasis, halfBit)) {
        // Intact pair: outcome is uniform and the partner collapses onto the
        // message state up to the Pauli frame X^x Z^z.
        out.zBit = rng.nextBit();
        out.xBit = rng.nextBit();
        uint8_t frame = message.basis_ == Basis::RECTILINEAR ? out.xBit : out.zBit;
        pc->stage = PairCorrelation::Stage::TELEPORTED;
        pc->resolvedBasis = message.basis_;
        pc->resolvedBit = message.bit_ ^ frame ^ pc->antiFlip();
        return out;
    }

    // The pair was already broken, so this is a Bell measurement on a
    // product state. Parity is fixed only when both qubits share a basis.
    if (halfBasis == message.basis_ && message.basis_ == Basis::RECTILINEAR) {
        out.xBit = message.bit_ ^ halfBit;
        out.zBit = rng.nextBit();
    } else if (halfBasis == message.basis_ && message.basis_ == Basis::DIAGONAL) {
        out.zBit = message.bit_ ^ halfBit;
        out.xBit = rng.nextBit();
    } else {
        out.zBit = rng.nextBit();
        out.xBit = rng.nextBit();
    }
    return out;
}

uint8_t applyCorrection(uint8_t outcome, Basis basis, const BellOutcome& correction) {
    if (basis == Basis::RECTILINEAR) return outcome ^ correction.xBit;
    if (basis == Basis::DIAGONAL) return outcome ^ correction.zBit;
    return outcome;
}

}
}
