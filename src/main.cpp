#include "quantum/qkd_simulator.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <getopt.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qkdsim {

static const char* VERSION = "0.1.0";

static std::atomic<bool> g_interrupted{false};

struct CliOptions {
    std::string command = "run";
    std::string configPath;
    std::string logLevel;
    std::string logFile;
    std::string saveConfigPath;
    // Settings given on the command line, applied over the config file.
    std::vector<std::pair<std::string, std::string>> overrides;
    bool showHelp = false;
    bool showVersion = false;
};

static void signalHandler(int) {
    g_interrupted = true;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [run|compare|protocols]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  run                 Run one protocol and print the run record as JSON (default)\n";
    std::cout << "  compare             Run every protocol with the same parameters\n";
    std::cout << "  protocols           List the available protocols\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version information\n";
    std::cout << "  -p, --protocol P    bb84, e91, bbm92 or teleportation\n";
    std::cout << "  -n, --qubits N      Number of transmitted units\n";
    std::cout << "  -e, --eavesdrop P   Intercept-resend probability in [0,1]\n";
    std::cout << "  --noise P           Channel bit-flip probability in [0,1]\n";
    std::cout << "  --loss P            Channel loss probability in [0,1]\n";
    std::cout << "  --sample F          Disclosed fraction of the sifted key, in (0,1)\n";
    std::cout << "  --threshold Q       Highest QBER that still accepts the key\n";
    std::cout << "  --min-sifted N      Fewest sifted bits needed for error estimation\n";
    std::cout << "  -s, --seed N        Seed for a reproducible run\n";
    std::cout << "  -b, --bits BITS     Sender key bits (BB84 and teleportation only)\n";
    std::cout << "  --teleport-basis B  rectilinear or diagonal\n";
    std::cout << "  -t, --transcript    Include every channel event in the JSON output\n";
    std::cout << "  -c, --config FILE   Read settings from a key=value file\n";
    std::cout << "  --save-config FILE  Write the effective settings to FILE before running\n";
    std::cout << "  --loglevel LEVEL    Log level (trace/debug/info/warn/error/off)\n";
    std::cout << "  --logfile PATH      Also write logs to PATH\n";
}

void printVersion() {
    std::cout << "qkdsim " << VERSION << "\n";
    std::cout << "Protocols: BB84, E91, BBM92, Teleportation QKD\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
    std::cout << "Classical channel signatures: libsecp256k1\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    enum LongOnly {
        OPT_NOISE = 1000,
        OPT_LOSS,
        OPT_SAMPLE,
        OPT_THRESHOLD,
        OPT_MIN_SIFTED,
        OPT_TELEPORT_BASIS,
        OPT_LOGLEVEL,
        OPT_LOGFILE,
        OPT_SAVE_CONFIG
    };
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"protocol", required_argument, nullptr, 'p'},
        {"qubits", required_argument, nullptr, 'n'},
        {"eavesdrop", required_argument, nullptr, 'e'},
        {"noise", required_argument, nullptr, OPT_NOISE},
        {"loss", required_argument, nullptr, OPT_LOSS},
        {"sample", required_argument, nullptr, OPT_SAMPLE},
        {"threshold", required_argument, nullptr, OPT_THRESHOLD},
        {"min-sifted", required_argument, nullptr, OPT_MIN_SIFTED},
        {"seed", required_argument, nullptr, 's'},
        {"bits", required_argument, nullptr, 'b'},
        {"teleport-basis", required_argument, nullptr, OPT_TELEPORT_BASIS},
        {"transcript", no_argument, nullptr, 't'},
        {"config", required_argument, nullptr, 'c'},
        {"loglevel", required_argument, nullptr, OPT_LOGLEVEL},
        {"logfile", required_argument, nullptr, OPT_LOGFILE},
        {"save-config", required_argument, nullptr, OPT_SAVE_CONFIG},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hvp:n:e:s:b:tc:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                opts.showHelp = true;
                return true;
            case 'v':
                opts.showVersion = true;
                return true;
            case 'p':
                opts.overrides.emplace_back("simulation.protocol", optarg);
                break;
            case 'n':
                opts.overrides.emplace_back("simulation.qubit_count", optarg);
                break;
            case 'e':
                opts.overrides.emplace_back("simulation.eavesdrop_probability", optarg);
                break;
            case OPT_NOISE:
                opts.overrides.emplace_back("simulation.channel_noise_probability", optarg);
                break;
            case OPT_LOSS:
                opts.overrides.emplace_back("simulation.channel_loss_probability", optarg);
                break;
            case OPT_SAMPLE:
                opts.overrides.emplace_back("simulation.disclosed_sample_fraction", optarg);
                break;
            case OPT_THRESHOLD:
                opts.overrides.emplace_back("simulation.qber_threshold", optarg);
                break;
            case OPT_MIN_SIFTED:
                opts.overrides.emplace_back("simulation.min_sifted_bits", optarg);
                break;
            case 's':
                opts.overrides.emplace_back("simulation.seed", optarg);
                break;
            case 'b':
                opts.overrides.emplace_back("simulation.custom_bits", optarg);
                break;
            case OPT_TELEPORT_BASIS:
                opts.overrides.emplace_back("simulation.teleportation_basis", optarg);
                break;
            case 't':
                opts.overrides.emplace_back("report.include_transcript", "true");
                break;
            case 'c':
                opts.configPath = optarg;
                break;
            case OPT_LOGLEVEL:
                opts.logLevel = optarg;
                break;
            case OPT_LOGFILE:
                opts.logFile = optarg;
                break;
            case OPT_SAVE_CONFIG:
                opts.saveConfigPath = optarg;
                break;
            default:
                return false;
        }
    }

    if (optind < argc) {
        opts.command = argv[optind++];
        if (opts.command != "run" && opts.command != "compare" && opts.command != "protocols") {
            std::cerr << "qkdsim: unknown command '" << opts.command << "'\n";
            return false;
        }
    }
    if (optind < argc) {
        std::cerr << "qkdsim: unexpected argument '" << argv[optind] << "'\n";
        return false;
    }
    return true;
}

// Values that the typed getters would silently replace with defaults are
// rejected here so that a typo on the command line is never ignored.
static bool checkOverride(const std::string& key, const std::string& value) {
    if (key == "simulation.protocol") {
        quantum::Protocol p;
        if (!quantum::parseProtocol(value, p)) {
            std::cerr << "qkdsim: unknown protocol '" << value << "'\n";
            return false;
        }
        return true;
    }
    if (key == "simulation.teleportation_basis") {
        quantum::Basis b;
        if (!quantum::parseBasis(value, b)) {
            std::cerr << "qkdsim: unknown basis '" << value << "'\n";
            return false;
        }
        return true;
    }
    if (key == "simulation.custom_bits" || key == "report.include_transcript") return true;

    try {
        size_t used = 0;
        if (key == "simulation.qubit_count" || key == "simulation.min_sifted_bits") {
            std::stoll(value, &used);
        } else if (key == "simulation.seed") {
            if (!value.empty() && value[0] == '-') throw std::invalid_argument("negative");
            std::stoull(value, &used);
        } else {
            std::stod(value, &used);
        }
        if (used != value.size()) throw std::invalid_argument("trailing characters");
    } catch (const std::exception&) {
        std::cerr << "qkdsim: invalid value '" << value << "' for " << key << "\n";
        return false;
    }
    return true;
}

static bool setupLogging(const CliOptions& opts) {
    utils::LogConfig logCfg = utils::Config::instance().getLogConfig();
    std::string levelName = opts.logLevel.empty() ? logCfg.level : opts.logLevel;
    utils::LogLevel level;
    if (!utils::Logger::parseLevel(levelName, level)) {
        std::cerr << "qkdsim: unknown log level '" << levelName << "'\n";
        return false;
    }
    utils::Logger::setLevel(level);
    utils::Logger::enableConsole(logCfg.console);

    std::string logFile = opts.logFile.empty() ? logCfg.file : opts.logFile;
    if (!logFile.empty()) {
        utils::Logger::init(logFile);
        if (!utils::Logger::isInitialized()) {
            std::cerr << "qkdsim: cannot open log file " << logFile << "\n";
            return false;
        }
    }
    return true;
}

static void printError(const Error& err) {
    std::cerr << "qkdsim: " << errorCodeName(err.code) << ": " << err.message;
    if (!err.context.empty()) std::cerr << " (" << err.context << ")";
    std::cerr << "\n";
    if (err.isConfigurationError()) {
        std::cerr << "Try 'qkdsim --help' for the accepted parameter ranges.\n";
    }
}

// Runs work on a helper thread so that SIGINT can cancel the simulation
// between phases.
template<typename T>
static T runInterruptible(quantum::QKDSimulator& sim, std::function<T()> work) {
    auto fut = std::async(std::launch::async, std::move(work));
    bool stopSent = false;
    while (fut.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (g_interrupted && !stopSent) {
            LOG_INFO("Interrupt received, stopping simulation");
            sim.requestStop();
            stopSent = true;
        }
    }
    return fut.get();
}

static int commandRun(quantum::QKDSimulator& sim, const quantum::SimulationConfig& cfg) {
    auto result = runInterruptible<Result<quantum::RunRecord>>(sim, [&sim, &cfg]() { return sim.run(cfg); });
    if (result.failed()) {
        printError(result.error());
        return exitStatus(result.error().code);
    }
    std::cout << result.value().toJson(cfg.includeTranscript) << "\n";
    return 0;
}

static int commandCompare(quantum::QKDSimulator& sim, const quantum::SimulationConfig& cfg) {
    auto entries = runInterruptible<std::vector<quantum::ComparisonEntry>>(
        sim, [&sim, &cfg]() { return sim.compare(cfg); });

    utils::TableFormatter table;
    table.setHeaders({"Protocol", "Sifted", "QBER", "Agreement", "Final key", "Security", "Result"});
    for (size_t col = 1; col <= 4; col++) table.alignRight(col);
    int rc = 0;
    for (const auto& entry : entries) {
        if (!entry.ok) {
            table.addRow({quantum::protocolToString(entry.protocol), "-", "-", "-", "-", "-",
                          std::string("error: ") + errorCodeName(entry.error.code)});
            if (entry.error.code == ErrorCode::RUN_CANCELLED) rc = EXIT_RUN_CANCELLED;
            continue;
        }
        const quantum::RunRecord& r = entry.record;
        table.addRow({
            quantum::protocolToString(r.protocol),
            std::to_string(r.siftedKeyLength()),
            utils::Formatter::formatPercent(r.qber(), 2),
            utils::Formatter::formatPercent(r.agreementRate, 2),
            std::to_string(r.finalKey.size()),
            r.securityLevel,
            r.secure ? "secure" : "abort"
        });
    }
    std::cout << table.render();
    if (!entries.empty() && entries.front().ok) {
        std::cout << "seed: " << entries.front().record.seed << "\n";
    }
    return rc;
}

static int commandProtocols() {
    utils::TableFormatter table;
    table.setHeaders({"Key", "Name", "Description"});
    for (const auto& info : quantum::QKDSimulator::listProtocols()) {
        table.addRow({info.key, info.name, info.description});
    }
    std::cout << table.render();
    return 0;
}

}

int main(int argc, char* argv[]) {
    qkdsim::CliOptions opts;
    if (!qkdsim::parseArgs(argc, argv, opts)) {
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    }
    if (opts.showHelp) {
        qkdsim::printHelp(argv[0]);
        return 0;
    }
    if (opts.showVersion) {
        qkdsim::printVersion();
        return 0;
    }

    auto& config = qkdsim::utils::Config::instance();
    if (!opts.configPath.empty() && !config.load(opts.configPath)) {
        std::cerr << "qkdsim: cannot read config file " << opts.configPath << "\n";
        return 1;
    }
    for (const auto& [key, value] : opts.overrides) {
        if (!qkdsim::checkOverride(key, value)) return 1;
        config.set(key, value);
    }
    if (!qkdsim::setupLogging(opts)) return 1;

    std::signal(SIGINT, qkdsim::signalHandler);
    std::signal(SIGTERM, qkdsim::signalHandler);

    int rc = 0;
    if (opts.command == "protocols") {
        rc = qkdsim::commandProtocols();
    } else {
        qkdsim::quantum::SimulationConfig cfg = config.getSimulationConfig();
        if (!opts.saveConfigPath.empty()) {
            config.setSimulationConfig(cfg);
            if (!config.save(opts.saveConfigPath)) {
                std::cerr << "qkdsim: cannot write config file " << opts.saveConfigPath << "\n";
                qkdsim::utils::Logger::shutdown();
                return 1;
            }
        }
        qkdsim::quantum::QKDSimulator sim;
        rc = opts.command == "compare" ? qkdsim::commandCompare(sim, cfg)
                                       : qkdsim::commandRun(sim, cfg);
    }

    qkdsim::utils::Logger::shutdown();
    return rc;
}
