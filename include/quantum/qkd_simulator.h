#ifndef QKDSIM_QKD_SIMULATOR_H
#define QKDSIM_QKD_SIMULATOR_H

#include "quantum/qkd_types.h"
#include "quantum/result_reporter.h"
#include "infrastructure/error_handling.h"
#include <memory>
#include <string>
#include <vector>

namespace qkdsim {
namespace quantum {

struct ProtocolInfo {
    Protocol protocol;
    std::string key;
    std::string name;
    std::string description;
};

struct ComparisonEntry {
    Protocol protocol = Protocol::BB84;
    bool ok = false;
    RunRecord record;
    Error error;
};

class QKDSimulator {
public:
    QKDSimulator();
    ~QKDSimulator();

    // Validates the configuration, builds a fresh engine for the requested
    // protocol and runs it to completion.
    Result<RunRecord> run(const SimulationConfig& config);

    // Runs every protocol with the same parameters on a worker pool. One
    // failing protocol does not affect the others.
    std::vector<ComparisonEntry> compare(const SimulationConfig& config, size_t threads = 0);

    // Cancels every run in flight and every later run on this simulator.
    void requestStop();
    bool stopRequested() const;

    uint64_t completedRuns() const;

    static Result<void> validate(const SimulationConfig& config);
    static std::vector<ProtocolInfo> listProtocols();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}

#endif
