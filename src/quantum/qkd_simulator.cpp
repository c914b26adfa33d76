#include "quantum/qkd_simulator.h"
#include "quantum/protocol_engine.h"
#include "utils/logger.h"
#include "utils/thread_pool.h"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <set>

namespace qkdsim {
namespace quantum {

struct QKDSimulator::Impl {
    std::mutex mtx;
    std::set<ProtocolEngine*> active;
    std::atomic<uint64_t> completed{0};
    // Once set, every run on this simulator is cancelled, including runs
    // that had not started yet.
    std::atomic<bool> stopped{false};
};

// Keeps an engine visible to requestStop() for the duration of its run. The
// stop flag is read under the same lock requestStop() takes.
class ActiveRun {
public:
    ActiveRun(std::mutex& mtx, std::set<ProtocolEngine*>& active, const std::atomic<bool>& stopped,
              ProtocolEngine* engine)
        : mtx_(mtx), active_(active), engine_(engine) {
        std::lock_guard<std::mutex> lock(mtx_);
        active_.insert(engine_);
        if (stopped) engine_->requestStop();
    }
    ~ActiveRun() { release(); }

    void release() {
        if (!engine_) return;
        std::lock_guard<std::mutex> lock(mtx_);
        active_.erase(engine_);
        engine_ = nullptr;
    }

private:
    std::mutex& mtx_;
    std::set<ProtocolEngine*>& active_;
    ProtocolEngine* engine_;
};

static const Protocol ALL_PROTOCOLS[] = {
    Protocol::BB84, Protocol::E91, Protocol::BBM92, Protocol::TELEPORTATION
};

// Expects the caller's ScopedContext to still be active.
static Error reportFailure(Protocol protocol, Error error) {
    if (error.context.empty()) error.context = ErrorHandler::instance().getContext();
    LOG_WARN(std::string(protocolToString(protocol)) + " run failed: " +
             errorToString(error.code) + ": " + error.message);
    ErrorHandler::instance().handle(error);
    return error;
}

static bool inUnitInterval(double p) {
    return p >= 0.0 && p <= 1.0;
}

QKDSimulator::QKDSimulator() : impl_(std::make_unique<Impl>()) {}
QKDSimulator::~QKDSimulator() = default;

Result<void> QKDSimulator::validate(const SimulationConfig& config) {
    if (config.qubitCount <= 0 || config.qubitCount > MAX_QUBIT_COUNT) {
        return makeError(ErrorCode::INVALID_PROTOCOL_PARAMETERS,
                         "qubit count must be between 1 and " + std::to_string(MAX_QUBIT_COUNT) +
                         ", got " + std::to_string(config.qubitCount));
    }
    if (!inUnitInterval(config.eavesdropProbability)) {
        return makeError(ErrorCode::INVALID_PROTOCOL_PARAMETERS,
                         "eavesdrop probability must lie in [0,1]");
    }
    if (!inUnitInterval(config.channelNoiseProbability)) {
        return makeError(ErrorCode::INVALID_NOISE_PROBABILITY,
                         "channel noise probability must lie in [0,1]");
    }
    if (!inUnitInterval(config.channelLossProbability)) {
        return makeError(ErrorCode::INVALID_NOISE_PROBABILITY,
                         "channel loss probability must lie in [0,1]");
    }
    if (!(config.disclosedSampleFraction > 0.0 && config.disclosedSampleFraction < 1.0)) {
        return makeError(ErrorCode::INVALID_PROTOCOL_PARAMETERS,
                         "disclosed sample fraction must lie in (0,1)");
    }
    if (!inUnitInterval(config.qberThreshold)) {
        return makeError(ErrorCode::INVALID_PROTOCOL_PARAMETERS,
                         "QBER threshold must lie in [0,1]");
    }
    if (config.protocol == Protocol::TELEPORTATION && !isConjugateBasis(config.teleportationBasis)) {
        return makeError(ErrorCode::INVALID_BASIS,
                         std::string("teleportation basis must be rectilinear or diagonal, got ") +
                         basisToString(config.teleportationBasis));
    }

    if (!config.customBits.empty()) {
        if (config.protocol == Protocol::E91 || config.protocol == Protocol::BBM92) {
            return makeError(ErrorCode::INVALID_PROTOCOL_PARAMETERS,
                             std::string("custom bits are not supported by ") +
                             protocolToString(config.protocol) + ": key bits come from pair outcomes");
        }
        if (config.customBits.find_first_not_of("01") != std::string::npos) {
            return makeError(ErrorCode::INVALID_PROTOCOL_PARAMETERS,
                             "custom bits must contain only 0s and 1s");
        }
        if (static_cast<int64_t>(config.customBits.size()) < config.qubitCount) {
            return makeError(ErrorCode::INVALID_PROTOCOL_PARAMETERS,
                             "custom bits must be at least " + std::to_string(config.qubitCount) +
                             " characters long");
        }
    }
    return {};
}

Result<RunRecord> QKDSimulator::run(const SimulationConfig& config) {
    ScopedContext ctx(std::string("run ") + protocolToString(config.protocol));
    auto valid = validate(config);
    if (valid.failed()) return reportFailure(config.protocol, valid.error());

    uint64_t seed = config.seed ? *config.seed : RandomSource::freshSeed();
    std::unique_ptr<ProtocolEngine> engine = createEngine(config, seed);
    if (!engine) {
        return reportFailure(config.protocol,
                             makeError(ErrorCode::INTERNAL_ERROR, "no engine for protocol"));
    }

    ActiveRun tracked(impl_->mtx, impl_->active, impl_->stopped, engine.get());
    auto result = engine->run();
    tracked.release();

    if (result.failed()) return reportFailure(config.protocol, result.error());
    impl_->completed++;
    return result;
}

std::vector<ComparisonEntry> QKDSimulator::compare(const SimulationConfig& config, size_t threads) {
    SimulationConfig shared = config;
    // Every protocol sees the same seed, even when none was configured.
    if (!shared.seed) shared.seed = RandomSource::freshSeed();

    size_t count = sizeof(ALL_PROTOCOLS) / sizeof(ALL_PROTOCOLS[0]);
    if (threads == 0) threads = std::min<size_t>(count, std::max(1u, std::thread::hardware_concurrency()));
    utils::ThreadPool pool(threads);

    std::vector<std::future<ComparisonEntry>> pending;
    for (Protocol protocol : ALL_PROTOCOLS) {
        SimulationConfig cfg = shared;
        cfg.protocol = protocol;
        pending.push_back(pool.enqueue([this, cfg]() {
            ComparisonEntry entry;
            entry.protocol = cfg.protocol;
            auto result = run(cfg);
            entry.ok = result.ok();
            if (entry.ok) {
                entry.record = std::move(result.value());
            } else {
                entry.error = result.error();
            }
            return entry;
        }));
    }

    std::vector<ComparisonEntry> entries;
    entries.reserve(pending.size());
    for (size_t i = 0; i < pending.size(); i++) {
        try {
            entries.push_back(pending[i].get());
        } catch (const std::exception& e) {
            ComparisonEntry failed;
            failed.protocol = ALL_PROTOCOLS[i];
            ScopedContext ctx(std::string("compare ") + protocolToString(failed.protocol));
            failed.error = reportFailure(failed.protocol,
                                         makeError(ErrorCode::INTERNAL_ERROR, e.what()));
            entries.push_back(std::move(failed));
        }
    }
    return entries;
}

void QKDSimulator::requestStop() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->stopped = true;
    for (ProtocolEngine* engine : impl_->active) engine->requestStop();
}

bool QKDSimulator::stopRequested() const {
    return impl_->stopped;
}

uint64_t QKDSimulator::completedRuns() const {
    return impl_->completed;
}

std::vector<ProtocolInfo> QKDSimulator::listProtocols() {
    return {
        {Protocol::BB84, "bb84", "BB84",
         "First practical quantum key distribution protocol using photon polarization"},
        {Protocol::E91, "e91", "E91",
         "Entanglement-based QKD protocol using Bell states"},
        {Protocol::BBM92, "bbm92", "BBM92",
         "Bell state measurement based QKD protocol"},
        {Protocol::TELEPORTATION, "teleportation", "Teleportation QKD",
         "QKD using quantum teleportation protocol"}
    };
}

}
}
