#ifndef QKDSIM_PROTOCOL_ENGINE_H
#define QKDSIM_PROTOCOL_ENGINE_H

#include "quantum/qkd_types.h"
#include "quantum/random_source.h"
#include "quantum/quantum_unit.h"
#include "quantum/channel.h"
#include "quantum/eavesdropper.h"
#include "quantum/classical_channel.h"
#include "quantum/reconciliation.h"
#include "quantum/result_reporter.h"
#include "infrastructure/error_handling.h"
#include <memory>
#include <vector>

namespace qkdsim {
namespace quantum {

/**
 * One protocol run. run() walks the fixed phase sequence
 *
 *   INIT -> PREPARING -> TRANSMITTING -> DISCLOSING_BASES -> SIFTING
 *        -> ESTIMATING_ERROR -> ACCEPTED | REJECTED
 *
 * and calls the protocol-specific hooks for the first three phases. Sifting,
 * error estimation and key finalization are shared. An engine runs once;
 * every engine owns its RandomSource, Channel, Eavesdropper and classical
 * channel, so separate engines never share mutable state.
 */
class ProtocolEngine {
public:
    ProtocolEngine(Protocol protocol, const SimulationConfig& config, uint64_t seed);
    virtual ~ProtocolEngine();

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    Result<RunRecord> run();

    // Safe to call from another thread. The run stops before its next phase.
    void requestStop();
    bool stopRequested() const;

    Protocol protocol() const;
    RunState state() const;
    std::vector<RunState> phaseHistory() const;
    uint64_t seed() const;

    ClassicalChannel& classicalChannel();
    const Channel& channel() const;
    const Eavesdropper* eavesdropper() const;

protected:
    virtual Result<void> prepareUnits() = 0;
    virtual Result<void> transmitUnits() = 0;
    virtual Result<void> discloseBases() = 0;
    // Extra statistics computed from the transcript after sifting.
    virtual void analyzeTranscript(ReconciliationResult& result);

    const SimulationConfig& config() const;
    RandomSource& rng();
    Channel& quantumChannel();
    Eavesdropper* eve();
    Transcript& transcript();

    // Sender's key bit for round i: caller-supplied or random.
    uint8_t senderBit(size_t i);
    // Both parties publish a basis list and each verifies the other's.
    Result<void> exchangeBases(const std::vector<Basis>& alice, const std::vector<Basis>& bob);

private:
    Result<void> enter(RunState next);
    Result<void> discloseSample(const ReconciliationResult& result);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class BB84Engine : public ProtocolEngine {
public:
    BB84Engine(const SimulationConfig& config, uint64_t seed);
    ~BB84Engine() override;

protected:
    Result<void> prepareUnits() override;
    Result<void> transmitUnits() override;
    Result<void> discloseBases() override;

private:
    std::vector<QuantumUnit> units_;
    std::vector<uint8_t> bits_;
    std::vector<Basis> senderBases_;
    std::vector<Basis> receiverBases_;
};

// Shared source-in-the-middle model for E91 and BBM92: a singlet pair per
// round, one half kept by Alice and the other sent to Bob over the channel.
class EntangledPairEngine : public ProtocolEngine {
public:
    EntangledPairEngine(Protocol protocol, const SimulationConfig& config, uint64_t seed);
    ~EntangledPairEngine() override;

protected:
    Result<void> prepareUnits() override;
    Result<void> transmitUnits() override;
    Result<void> discloseBases() override;

    virtual Basis chooseAliceBasis() = 0;
    virtual Basis chooseBobBasis() = 0;

private:
    std::vector<EntangledPair> pairs_;
    std::vector<Basis> aliceBases_;
    std::vector<Basis> bobBases_;
};

class E91Engine : public EntangledPairEngine {
public:
    E91Engine(const SimulationConfig& config, uint64_t seed);

protected:
    Basis chooseAliceBasis() override;
    Basis chooseBobBasis() override;
    void analyzeTranscript(ReconciliationResult& result) override;
};

class BBM92Engine : public EntangledPairEngine {
public:
    BBM92Engine(const SimulationConfig& config, uint64_t seed);

protected:
    Basis chooseAliceBasis() override;
    Basis chooseBobBasis() override;
};

class TeleportationEngine : public ProtocolEngine {
public:
    TeleportationEngine(const SimulationConfig& config, uint64_t seed);
    ~TeleportationEngine() override;

protected:
    Result<void> prepareUnits() override;
    Result<void> transmitUnits() override;
    Result<void> discloseBases() override;

private:
    std::vector<QuantumUnit> messages_;
    std::vector<EntangledPair> pairs_;
    std::vector<uint8_t> bits_;
};

std::unique_ptr<ProtocolEngine> createEngine(const SimulationConfig& config, uint64_t seed);

}
}

#endif
