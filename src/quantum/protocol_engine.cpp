#include "quantum/protocol_engine.h"
#include "utils/logger.h"
#include <atomic>
#include <mutex>

namespace qkdsim {
namespace quantum {

struct ProtocolEngine::Impl {
    mutable std::mutex mtx;
    Protocol protocol;
    SimulationConfig config;
    uint64_t seed;
    RandomSource rng;
    Channel channel;
    std::unique_ptr<Eavesdropper> eve;
    ClassicalChannel classical;
    Transcript transcript;

    RunState state = RunState::INIT;
    std::vector<RunState> phases;
    std::atomic<bool> stop{false};
    bool started = false;

    Impl(Protocol p, const SimulationConfig& cfg, uint64_t s)
        : protocol(p), config(cfg), seed(s), rng(s),
          channel(cfg.channelNoiseProbability, cfg.channelLossProbability),
          classical(s) {
        if (cfg.eavesdropProbability > 0.0) {
            eve = std::make_unique<Eavesdropper>(cfg.eavesdropProbability);
        }
        transcript.protocol = p;
        phases.push_back(RunState::INIT);
    }
};

static std::vector<uint8_t> encodeBases(const std::vector<Basis>& bases) {
    std::vector<uint8_t> out;
    out.reserve(bases.size());
    for (Basis b : bases) out.push_back(static_cast<uint8_t>(b));
    return out;
}

ProtocolEngine::ProtocolEngine(Protocol protocol, const SimulationConfig& config, uint64_t seed)
    : impl_(std::make_unique<Impl>(protocol, config, seed)) {}

ProtocolEngine::~ProtocolEngine() = default;

void ProtocolEngine::requestStop() {
    impl_->stop = true;
}

bool ProtocolEngine::stopRequested() const {
    return impl_->stop;
}

Protocol ProtocolEngine::protocol() const {
    return impl_->protocol;
}

RunState ProtocolEngine::state() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->state;
}

std::vector<RunState> ProtocolEngine::phaseHistory() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->phases;
}

uint64_t ProtocolEngine::seed() const {
    return impl_->seed;
}

ClassicalChannel& ProtocolEngine::classicalChannel() { return impl_->classical; }
const Channel& ProtocolEngine::channel() const { return impl_->channel; }
const Eavesdropper* ProtocolEngine::eavesdropper() const { return impl_->eve.get(); }

const SimulationConfig& ProtocolEngine::config() const { return impl_->config; }
RandomSource& ProtocolEngine::rng() { return impl_->rng; }
Channel& ProtocolEngine::quantumChannel() { return impl_->channel; }
Eavesdropper* ProtocolEngine::eve() { return impl_->eve.get(); }
Transcript& ProtocolEngine::transcript() { return impl_->transcript; }

void ProtocolEngine::analyzeTranscript(ReconciliationResult&) {}

uint8_t ProtocolEngine::senderBit(size_t i) {
    const std::string& custom = impl_->config.customBits;
    if (i < custom.size()) return custom[i] == '1' ? 1 : 0;
    return impl_->rng.nextBit();
}

Result<void> ProtocolEngine::enter(RunState next) {
    if (impl_->stop) {
        LOG_INFO(std::string(protocolToString(impl_->protocol)) + " run cancelled before " +
                 runStateToString(next));
        return makeError(ErrorCode::RUN_CANCELLED,
                         std::string("run stopped before ") + runStateToString(next));
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->state = next;
        impl_->phases.push_back(next);
    }
    LOG_DEBUG(std::string(protocolToString(impl_->protocol)) + " -> " + runStateToString(next));
    return {};
}

Result<void> ProtocolEngine::exchangeBases(const std::vector<Basis>& alice, const std::vector<Basis>& bob) {
    Disclosure fromAlice = impl_->classical.publish(Party::ALICE, "bases", encodeBases(alice));
    Disclosure fromBob = impl_->classical.publish(Party::BOB, "bases", encodeBases(bob));
    auto checked = impl_->classical.verify(fromAlice);
    if (checked.failed()) return checked;
    return impl_->classical.verify(fromBob);
}

Result<void> ProtocolEngine::discloseSample(const ReconciliationResult& result) {
    const auto& idx = result.estimate.disclosedIndices;
    std::vector<uint8_t> aliceBits, bobBits;
    aliceBits.reserve(idx.size());
    bobBits.reserve(idx.size());
    for (size_t i : idx) {
        aliceBits.push_back(result.sifted.senderBits[i]);
        bobBits.push_back(result.sifted.receiverBits[i]);
    }
    Disclosure fromAlice = impl_->classical.publish(Party::ALICE, "sample", packBits(aliceBits));
    Disclosure fromBob = impl_->classical.publish(Party::BOB, "sample", packBits(bobBits));
    auto checked = impl_->classical.verify(fromAlice);
    if (checked.failed()) return checked;
    return impl_->classical.verify(fromBob);
}

Result<RunRecord> ProtocolEngine::run() {
    if (impl_->started) {
        return makeError(ErrorCode::INVALID_STATE, "protocol engine has already run");
    }
    impl_->started = true;

    auto valid = impl_->channel.validate();
    if (valid.failed()) return valid.error();

    const char* name = protocolToString(impl_->protocol);
    utils::ScopedRunTag tag(std::string(name) + "#" + std::to_string(impl_->seed));
    LOG_INFO(std::string("Starting ") + name + " run: " + std::to_string(impl_->config.qubitCount) +
             " units, seed " + std::to_string(impl_->seed));

    auto step = enter(RunState::PREPARING);
    if (step.failed()) return step.error();
    step = prepareUnits();
    if (step.failed()) return step.error();

    step = enter(RunState::TRANSMITTING);
    if (step.failed()) return step.error();
    step = transmitUnits();
    if (step.failed()) return step.error();

    step = enter(RunState::DISCLOSING_BASES);
    if (step.failed()) return step.error();
    step = discloseBases();
    if (step.failed()) return step.error();

    step = enter(RunState::SIFTING);
    if (step.failed()) return step.error();
    ReconciliationResult rec;
    rec.sifted = sift(impl_->transcript);
    analyzeTranscript(rec);
    LOG_DEBUG(std::string(name) + " sifted " + std::to_string(rec.sifted.size()) + " of " +
              std::to_string(impl_->transcript.events.size()) + " units");

    step = enter(RunState::ESTIMATING_ERROR);
    if (step.failed()) return step.error();
    auto estimate = estimateError(rec.sifted, impl_->config.disclosedSampleFraction,
                                  impl_->rng, impl_->config.minSiftedBits);
    if (estimate.failed()) return estimate.error();
    rec.estimate = estimate.value();
    step = discloseSample(rec);
    if (step.failed()) return step.error();

    RunState verdict = rec.estimate.qber <= impl_->config.qberThreshold ? RunState::ACCEPTED
                                                                         : RunState::REJECTED;
    std::vector<RunState> phases;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->state = verdict;
        impl_->phases.push_back(verdict);
        phases = impl_->phases;
    }

    if (impl_->eve) {
        LOG_DEBUG(std::string(name) + " eavesdropper intercepted " +
                  std::to_string(impl_->eve->interceptCount()) + " units");
    }
    LOG_INFO(std::string(name) + " run " + runStateToString(verdict) + ": qber " +
             std::to_string(rec.estimate.qber) + " over " + std::to_string(rec.estimate.sampleSize) +
             " disclosed bits");

    ResultReporter reporter;
    auto done = reporter.finalize(impl_->config, impl_->seed, std::move(impl_->transcript),
                                  std::move(rec), std::move(phases));
    if (done.failed()) return done.error();
    LOG_DEBUG(std::string(name) + " final key " +
              utils::Logger::redactKey(bitsToString(reporter.report().finalKey)));
    return reporter.release();
}

EntangledPairEngine::EntangledPairEngine(Protocol protocol, const SimulationConfig& config, uint64_t seed)
    : ProtocolEngine(protocol, config, seed) {}

EntangledPairEngine::~EntangledPairEngine() = default;

Result<void> EntangledPairEngine::prepareUnits() {
    size_t n = static_cast<size_t>(config().qubitCount);
    pairs_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        pairs_.push_back(prepareEntangledPair(PairKind::ANTI_CORRELATED));
    }
    return {};
}

Result<void> EntangledPairEngine::transmitUnits() {
    size_t n = pairs_.size();
    aliceBases_.reserve(n);
    bobBases_.reserve(n);
    transcript().events.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        ChannelEvent ev;
        ev.index = i;

        auto delivered = quantumChannel().transmit(std::move(pairs_[i].second), eve(), rng());
        if (delivered.failed()) return delivered.error();
        Delivery& d = delivered.value();
        ev.intercepted = d.interception.intercepted;
        ev.eveBasis = d.interception.basis;
        ev.eveBit = d.interception.observedBit;

        ev.senderBasis = chooseAliceBasis();
        auto aliceBit = pairs_[i].first.measure(ev.senderBasis, rng());
        if (aliceBit.failed()) return aliceBit.error();
        ev.senderBit = aliceBit.value();

        ev.receiverBasis = chooseBobBasis();
        ev.lost = d.lost;
        if (!d.lost) {
            auto bobBit = d.measure(ev.receiverBasis, rng());
            if (bobBit.failed()) return bobBit.error();
            ev.noiseFlipped = d.noiseFlip;
            // Singlet outcomes are opposite; Bob complements into key convention.
            ev.receiverBit = static_cast<uint8_t>(bobBit.value() ^ 1);
        }

        aliceBases_.push_back(ev.senderBasis);
        bobBases_.push_back(ev.receiverBasis);
        transcript().events.push_back(ev);
    }
    pairs_.clear();
    return {};
}

Result<void> EntangledPairEngine::discloseBases() {
    return exchangeBases(aliceBases_, bobBases_);
}

std::unique_ptr<ProtocolEngine> createEngine(const SimulationConfig& config, uint64_t seed) {
    switch (config.protocol) {
        case Protocol::BB84:
            return std::make_unique<BB84Engine>(config, seed);
        case Protocol::E91:
            return std::make_unique<E91Engine>(config, seed);
        case Protocol::BBM92:
            return std::make_unique<BBM92Engine>(config, seed);
        case Protocol::TELEPORTATION:
            return std::make_unique<TeleportationEngine>(config, seed);
    }
    return nullptr;
}

}
}
