#include "quantum/protocol_engine.h"

namespace qkdsim {
namespace quantum {

BB84Engine::BB84Engine(const SimulationConfig& config, uint64_t seed)
    : ProtocolEngine(Protocol::BB84, config, seed) {}

BB84Engine::~BB84Engine() = default;

Result<void> BB84Engine::prepareUnits() {
    size_t count = static_cast<size_t>(config().qubitCount);
    units_.reserve(count);
    bits_.resize(count);
    senderBases_.resize(count);

    for (size_t i = 0; i < count; i++) {
        bits_[i] = senderBit(i);
        senderBases_[i] = rng().nextBit() ? Basis::DIAGONAL : Basis::RECTILINEAR;
        auto unit = QuantumUnit::prepare(bits_[i], senderBases_[i]);
        if (unit.failed()) return unit.error();
        units_.push_back(std::move(unit.value()));
    }
    return {};
}

Result<void> BB84Engine::transmitUnits() {
    size_t count = units_.size();
    receiverBases_.resize(count);
    transcript().events.reserve(count);

    for (size_t i = 0; i < count; i++) {
        ChannelEvent ev;
        ev.index = i;
        ev.senderBasis = senderBases_[i];
        ev.senderBit = bits_[i];

        auto delivered = quantumChannel().transmit(std::move(units_[i]), eve(), rng());
        if (delivered.failed()) return delivered.error();
        Delivery& d = delivered.value();
        ev.intercepted = d.interception.intercepted;
        ev.eveBasis = d.interception.basis;
        ev.eveBit = d.interception.observedBit;

        // Bob picks his basis without knowing whether anything arrived.
        receiverBases_[i] = rng().nextBit() ? Basis::DIAGONAL : Basis::RECTILINEAR;
        ev.receiverBasis = receiverBases_[i];
        ev.lost = d.lost;
        if (!d.lost) {
            auto bit = d.measure(ev.receiverBasis, rng());
            if (bit.failed()) return bit.error();
            ev.receiverBit = bit.value();
            ev.noiseFlipped = d.noiseFlip;
        }
        transcript().events.push_back(ev);
    }
    units_.clear();
    return {};
}

Result<void> BB84Engine::discloseBases() {
    return exchangeBases(senderBases_, receiverBases_);
}

}
}
