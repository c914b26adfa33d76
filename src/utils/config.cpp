#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace qkdsim {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("simulation.protocol", "bb84");
    set("simulation.qubit_count", quantum::DEFAULT_QUBIT_COUNT);
    set("simulation.eavesdrop_probability", 0.0);
    set("simulation.channel_noise_probability", 0.0);
    set("simulation.channel_loss_probability", 0.0);
    set("simulation.disclosed_sample_fraction", quantum::DEFAULT_SAMPLE_FRACTION);
    set("simulation.qber_threshold", quantum::DEFAULT_QBER_THRESHOLD);
    set("simulation.min_sifted_bits", static_cast<int64_t>(quantum::DEFAULT_MIN_SIFTED_BITS));
    set("simulation.teleportation_basis", "rectilinear");

    set("report.include_transcript", false);

    set("log.level", "warn");
    set("log.console", true);
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file " + path);
        return false;
    }

    std::vector<std::pair<std::string, std::string>> entries;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(file, line)) {
        lineNo++;
        std::string trimmed = Formatter::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto pos = trimmed.find('=');
        if (pos == std::string::npos) {
            LOG_WARN(path + ":" + std::to_string(lineNo) + ": ignoring line without '='");
            continue;
        }
        entries.emplace_back(Formatter::trim(trimmed.substr(0, pos)),
                             Formatter::trim(trimmed.substr(pos + 1)));
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->configPath = path;
    }
    for (auto& [key, value] : entries) store(key, std::move(value));
    LOG_DEBUG("Loaded " + std::to_string(entries.size()) + " settings from " + path);
    return true;
}

bool Config::save(const std::string& path) {
    std::vector<std::pair<std::string, std::string>> sorted;
    std::string savePath;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        savePath = path.empty() ? impl_->configPath : path;
        sorted.assign(impl_->data.begin(), impl_->data.end());
    }
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) {
        LOG_WARN("Cannot write config file " + savePath);
        return false;
    }

    std::sort(sorted.begin(), sorted.end());
    file << "# qkdsim configuration\n\n";
    std::string lastPrefix;
    for (const auto& [key, value] : sorted) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) file << "\n";
        lastPrefix = prefix;
        file << key << "=" << value << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::string raw = getString(key);
    if (raw.empty()) return def;
    try {
        size_t used = 0;
        int64_t v = std::stoll(raw, &used);
        if (used == raw.size()) return v;
        LOG_WARN("Config key " + key + " has trailing characters after an integer: " + raw);
        return def;
    } catch (const std::exception&) {
        LOG_WARN("Config key " + key + " is not an integer: " + raw);
        return def;
    }
}

double Config::getDouble(const std::string& key, double def) const {
    std::string raw = getString(key);
    if (raw.empty()) return def;
    try {
        size_t used = 0;
        double v = std::stod(raw, &used);
        if (used == raw.size()) return v;
        LOG_WARN("Config key " + key + " has trailing characters after a number: " + raw);
        return def;
    } catch (const std::exception&) {
        LOG_WARN("Config key " + key + " is not a number: " + raw);
        return def;
    }
}

bool Config::getBool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    std::string val = Formatter::toLower(getString(key));
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    return def;
}

void Config::store(const std::string& key, std::string value) {
    std::function<void(const std::string&)> callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data[key] = std::move(value);
        callback = impl_->changeCallback;
    }
    if (callback) callback(key);
}

void Config::set(const std::string& key, const std::string& value) {
    store(key, value);
}

void Config::set(const std::string& key, const char* value) {
    store(key, value ? std::string(value) : std::string());
}

void Config::set(const std::string& key, int64_t value) {
    store(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream ss;
    ss.precision(15);
    ss << value;
    store(key, ss.str());
}

void Config::set(const std::string& key, bool value) {
    store(key, value ? "true" : "false");
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::function<void(const std::string&)> callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.erase(key);
        callback = impl_->changeCallback;
    }
    if (callback) callback(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

quantum::SimulationConfig Config::getSimulationConfig() const {
    quantum::SimulationConfig cfg;

    std::string protocol = getString("simulation.protocol", "bb84");
    if (!quantum::parseProtocol(protocol, cfg.protocol)) {
        LOG_WARN("Unknown simulation.protocol '" + protocol + "', using BB84");
        cfg.protocol = quantum::Protocol::BB84;
    }
    cfg.qubitCount = getInt64("simulation.qubit_count", quantum::DEFAULT_QUBIT_COUNT);
    cfg.eavesdropProbability = getDouble("simulation.eavesdrop_probability", 0.0);
    cfg.channelNoiseProbability = getDouble("simulation.channel_noise_probability", 0.0);
    cfg.channelLossProbability = getDouble("simulation.channel_loss_probability", 0.0);
    cfg.disclosedSampleFraction = getDouble("simulation.disclosed_sample_fraction",
                                            quantum::DEFAULT_SAMPLE_FRACTION);
    cfg.qberThreshold = getDouble("simulation.qber_threshold", quantum::DEFAULT_QBER_THRESHOLD);
    int64_t minSifted = getInt64("simulation.min_sifted_bits",
                                 static_cast<int64_t>(quantum::DEFAULT_MIN_SIFTED_BITS));
    cfg.minSiftedBits = minSifted < 0 ? 0 : static_cast<size_t>(minSifted);

    std::string basis = getString("simulation.teleportation_basis", "rectilinear");
    if (!quantum::parseBasis(basis, cfg.teleportationBasis)) {
        LOG_WARN("Unknown simulation.teleportation_basis '" + basis + "', using rectilinear");
        cfg.teleportationBasis = quantum::Basis::RECTILINEAR;
    }

    if (has("simulation.seed")) {
        std::string raw = Formatter::trim(getString("simulation.seed"));
        std::string problem = "not an unsigned integer";
        // stoull accepts a sign and wraps negative input around.
        if (!raw.empty() && std::isdigit(static_cast<unsigned char>(raw[0]))) {
            try {
                size_t used = 0;
                uint64_t seed = std::stoull(raw, &used);
                if (used == raw.size()) {
                    cfg.seed = seed;
                    problem.clear();
                }
            } catch (const std::out_of_range&) {
                problem = "out of range";
            }
        }
        if (!problem.empty()) {
            LOG_WARN("Ignoring malformed simulation.seed '" + raw + "': " + problem);
        }
    }
    cfg.customBits = getString("simulation.custom_bits", "");
    cfg.includeTranscript = getBool("report.include_transcript", false);
    return cfg;
}

void Config::setSimulationConfig(const quantum::SimulationConfig& cfg) {
    std::string protocol = Formatter::toLower(quantum::protocolToString(cfg.protocol));
    set("simulation.protocol", protocol);
    set("simulation.qubit_count", cfg.qubitCount);
    set("simulation.eavesdrop_probability", cfg.eavesdropProbability);
    set("simulation.channel_noise_probability", cfg.channelNoiseProbability);
    set("simulation.channel_loss_probability", cfg.channelLossProbability);
    set("simulation.disclosed_sample_fraction", cfg.disclosedSampleFraction);
    set("simulation.qber_threshold", cfg.qberThreshold);
    set("simulation.min_sifted_bits", static_cast<int64_t>(cfg.minSiftedBits));
    set("simulation.teleportation_basis", quantum::basisToString(cfg.teleportationBasis));
    if (cfg.seed) {
        set("simulation.seed", std::to_string(*cfg.seed));
    } else {
        remove("simulation.seed");
    }
    if (cfg.customBits.empty()) {
        remove("simulation.custom_bits");
    } else {
        set("simulation.custom_bits", cfg.customBits);
    }
    set("report.include_transcript", cfg.includeTranscript);
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", "warn");
    cfg.file = getString("log.file", "");
    cfg.console = getBool("log.console", true);
    return cfg;
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = std::move(callback);
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

}
}
