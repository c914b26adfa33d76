#ifndef QKDSIM_RESULT_REPORTER_H
#define QKDSIM_RESULT_REPORTER_H

#include "quantum/qkd_types.h"
#include "quantum/reconciliation.h"
#include "infrastructure/error_handling.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace qkdsim {
namespace quantum {

struct TranscriptSummary {
    size_t units = 0;
    size_t lost = 0;
    size_t intercepted = 0;
    size_t noiseFlips = 0;
    size_t authenticationFailures = 0;
    size_t sifted = 0;
    size_t discarded = 0;
    size_t disclosed = 0;
    size_t sampleMismatches = 0;
    size_t finalKeyLength = 0;
    size_t finalKeyMismatches = 0;
};

struct RunRecord {
    Protocol protocol = Protocol::BB84;
    SimulationConfig parameters;
    uint64_t seed = 0;
    Transcript transcript;
    ReconciliationResult reconciliation;
    std::vector<uint8_t> finalKey;
    std::vector<uint8_t> receiverFinalKey;
    RunState state = RunState::INIT;
    std::vector<RunState> phases;
    bool secure = false;
    std::string securityLevel;
    double agreementRate = 0.0;
    std::string privacyAmplifiedKey;
    TranscriptSummary summary;

    size_t siftedKeyLength() const { return reconciliation.sifted.size(); }
    double qber() const { return reconciliation.estimate.qber; }

    nlohmann::json toJsonValue(bool includeTranscript = false) const;
    std::string toJson(bool includeTranscript = false, int indent = 2) const;
};

/**
 * Assembles the RunRecord of one run from the engine's outputs. The record
 * is built exactly once; afterwards it can only be read.
 */
class ResultReporter {
public:
    Result<void> finalize(const SimulationConfig& parameters, uint64_t seed,
                          Transcript transcript, ReconciliationResult reconciliation,
                          std::vector<RunState> phases);

    bool isFinalized() const { return finalized_; }

    // Before finalize this is an empty record in state INIT.
    const RunRecord& report() const { return record_; }

    RunRecord release();

private:
    RunRecord record_;
    bool finalized_ = false;
};

}
}

#endif
