#include "quantum/result_reporter.h"

namespace qkdsim {
namespace quantum {

using json = nlohmann::json;

static json parametersJson(const SimulationConfig& p) {
    return {
        {"qubit_count", p.qubitCount},
        {"eavesdrop_probability", p.eavesdropProbability},
        {"channel_noise_probability", p.channelNoiseProbability},
        {"channel_loss_probability", p.channelLossProbability},
        {"disclosed_sample_fraction", p.disclosedSampleFraction},
        {"qber_threshold", p.qberThreshold},
        {"min_sifted_bits", p.minSiftedBits},
        {"teleportation_basis", basisToString(p.teleportationBasis)},
        {"custom_bits", !p.customBits.empty()}
    };
}

static json summaryJson(const TranscriptSummary& s) {
    return {
        {"units", s.units},
        {"lost", s.lost},
        {"intercepted", s.intercepted},
        {"noise_flips", s.noiseFlips},
        {"authentication_failures", s.authenticationFailures},
        {"sifted", s.sifted},
        {"discarded", s.discarded},
        {"disclosed", s.disclosed},
        {"sample_mismatches", s.sampleMismatches},
        {"final_key_length", s.finalKeyLength},
        {"final_key_mismatches", s.finalKeyMismatches}
    };
}

static json eventJson(const ChannelEvent& ev) {
    json j;
    j["index"] = ev.index;
    j["sender_basis"] = basisToString(ev.senderBasis);
    j["sender_bit"] = static_cast<int>(ev.senderBit);
    j["receiver_basis"] = basisToString(ev.receiverBasis);
    j["lost"] = ev.lost;
    if (!ev.lost) j["receiver_bit"] = static_cast<int>(ev.receiverBit);
    j["noise_flipped"] = ev.noiseFlipped;
    j["intercepted"] = ev.intercepted;
    if (ev.intercepted) {
        j["eve_basis"] = basisToString(ev.eveBasis);
        j["eve_bit"] = static_cast<int>(ev.eveBit);
    }
    return j;
}

static json bellJson(const BellTest& bt) {
    json j;
    j["s"] = bt.s;
    j["correlations"] = json::array();
    j["samples"] = json::array();
    for (int i = 0; i < 4; ++i) {
        j["correlations"].push_back(bt.correlation[i]);
        j["samples"].push_back(bt.samples[i]);
    }
    j["complete"] = bt.complete;
    return j;
}

json RunRecord::toJsonValue(bool includeTranscript) const {
    json j;
    j["protocol"] = protocolToString(protocol);
    j["parameters"] = parametersJson(parameters);
    j["seed"] = seed;
    j["state"] = runStateToString(state);
    j["phases"] = json::array();
    for (RunState s : phases) j["phases"].push_back(runStateToString(s));
    j["sifted_key_length"] = siftedKeyLength();
    j["qber"] = qber();
    j["final_key"] = json::array();
    for (uint8_t b : finalKey) j["final_key"].push_back(static_cast<int>(b));
    j["secure"] = secure;
    j["security_level"] = securityLevel;
    j["agreement_rate"] = agreementRate;
    if (reconciliation.bell) j["bell_parameter"] = bellJson(*reconciliation.bell);
    if (privacyAmplifiedKey.empty()) {
        j["privacy_amplified_key"] = nullptr;
    } else {
        j["privacy_amplified_key"] = privacyAmplifiedKey;
    }

    j["transcript_summary"] = summaryJson(summary);
    if (includeTranscript) {
        json events = json::array();
        for (const auto& ev : transcript.events) events.push_back(eventJson(ev));
        j["transcript_summary"]["events"] = std::move(events);
    }
    return j;
}

std::string RunRecord::toJson(bool includeTranscript, int indent) const {
    return toJsonValue(includeTranscript).dump(indent);
}

Result<void> ResultReporter::finalize(const SimulationConfig& parameters, uint64_t seed,
                                      Transcript transcript, ReconciliationResult reconciliation,
                                      std::vector<RunState> phases) {
    if (finalized_) {
        return makeError(ErrorCode::INVALID_STATE, "run record already finalized");
    }
    if (phases.empty()) {
        return makeError(ErrorCode::INVALID_STATE, "run record needs at least one phase");
    }

    RunRecord r;
    r.protocol = transcript.protocol;
    r.parameters = parameters;
    r.seed = seed;
    r.state = phases.back();
    r.phases = std::move(phases);

    const SiftedKey& sifted = reconciliation.sifted;
    const ErrorEstimate& est = reconciliation.estimate;
    r.finalKey = finalizeKey(sifted.senderBits, est.disclosedIndices);
    r.receiverFinalKey = finalizeKey(sifted.receiverBits, est.disclosedIndices);
    r.secure = r.state == RunState::ACCEPTED;
    r.securityLevel = quantum::securityLevel(est.qber);
    r.agreementRate = quantum::agreementRate(sifted);
    if (r.secure && !r.finalKey.empty()) {
        r.privacyAmplifiedKey = privacyAmplify(r.finalKey);
    }

    TranscriptSummary& s = r.summary;
    s.units = transcript.events.size();
    for (const auto& ev : transcript.events) {
        if (ev.lost) s.lost++;
        if (ev.intercepted) s.intercepted++;
        if (ev.noiseFlipped) s.noiseFlips++;
        if (!ev.lost && !ev.correctionAuthenticated) s.authenticationFailures++;
    }
    s.sifted = sifted.size();
    s.discarded = sifted.discarded;
    s.disclosed = est.sampleSize;
    s.sampleMismatches = est.mismatches;
    s.finalKeyLength = r.finalKey.size();
    for (size_t i = 0; i < r.finalKey.size(); ++i) {
        if (r.finalKey[i] != r.receiverFinalKey[i]) s.finalKeyMismatches++;
    }

    r.transcript = std::move(transcript);
    r.reconciliation = std::move(reconciliation);
    record_ = std::move(r);
    finalized_ = true;
    return {};
}

RunRecord ResultReporter::release() {
    return std::move(record_);
}

}
}
