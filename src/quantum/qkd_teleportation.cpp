#include "quantum/protocol_engine.h"
#include "utils/logger.h"

namespace qkdsim {
namespace quantum {

TeleportationEngine::TeleportationEngine(const SimulationConfig& config, uint64_t seed)
    : ProtocolEngine(Protocol::TELEPORTATION, config, seed) {}

TeleportationEngine::~TeleportationEngine() = default;

Result<void> TeleportationEngine::prepareUnits() {
    size_t count = static_cast<size_t>(config().qubitCount);
    Basis basis = config().teleportationBasis;
    bits_.resize(count);
    messages_.reserve(count);
    pairs_.reserve(count);

    for (size_t i = 0; i < count; i++) {
        bits_[i] = senderBit(i);
        auto message = QuantumUnit::prepare(bits_[i], basis);
        if (message.failed()) return message.error();
        messages_.push_back(std::move(message.value()));
        pairs_.push_back(prepareEntangledPair(PairKind::CORRELATED));
    }
    return {};
}

Result<void> TeleportationEngine::transmitUnits() {
    size_t count = messages_.size();
    Basis basis = config().teleportationBasis;
    std::vector<ChannelEvent>& events = transcript().events;
    events.reserve(count);
    std::vector<Delivery> deliveries;
    deliveries.reserve(count);
    std::vector<uint8_t> corrections;
    corrections.reserve(count);

    for (size_t i = 0; i < count; i++) {
        ChannelEvent ev;
        ev.index = i;
        ev.senderBasis = basis;
        ev.senderBit = bits_[i];
        ev.receiverBasis = basis;

        // The source hands one half to Alice and sends the other to Bob.
        auto delivered = quantumChannel().transmit(std::move(pairs_[i].second), eve(), rng());
        if (delivered.failed()) return delivered.error();
        Delivery& d = delivered.value();
        ev.intercepted = d.interception.intercepted;
        ev.eveBasis = d.interception.basis;
        ev.eveBit = d.interception.observedBit;
        ev.lost = d.lost;

        auto bell = bellMeasure(messages_[i], pairs_[i].first, rng());
        if (bell.failed()) return bell.error();
        ev.correction = bell.value().packed();
        corrections.push_back(ev.correction);

        deliveries.push_back(std::move(d));
        events.push_back(ev);
    }

    // All corrections travel in one signed message.
    Disclosure msg = classicalChannel().publishRounds(Party::ALICE, "corrections", corrections);
    std::vector<bool> trusted = classicalChannel().verifyRounds(msg, count);
    size_t rejected = 0;

    for (size_t i = 0; i < count; i++) {
        ChannelEvent& ev = events[i];
        ev.correctionAuthenticated = trusted[i];
        if (!trusted[i]) {
            rejected++;
            continue;
        }
        Delivery& d = deliveries[i];
        if (d.lost) continue;

        // Bob applies the correction carried by the message he received.
        uint8_t value = msg.payload[i * ROUND_RECORD_SIZE];
        BellOutcome received;
        received.zBit = value & 1;
        received.xBit = (value >> 1) & 1;
        auto outcome = d.measure(basis, rng());
        if (outcome.failed()) return outcome.error();
        ev.receiverBit = applyCorrection(outcome.value(), basis, received);
        ev.noiseFlipped = d.noiseFlip;
    }

    if (rejected > 0) {
        LOG_WARN("Teleportation run discarded " + std::to_string(rejected) +
                 " rounds whose correction failed authentication");
    }
    messages_.clear();
    pairs_.clear();
    return {};
}

Result<void> TeleportationEngine::discloseBases() {
    // The basis is agreed in advance; both sides confirm it publicly.
    std::vector<Basis> agreed(1, config().teleportationBasis);
    return exchangeBases(agreed, agreed);
}

}
}
