#pragma once

#include "quantum/qkd_types.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace qkdsim {
namespace utils {

struct LogConfig {
    std::string level = "warn";
    std::string file;
    bool console = true;
};

/**
 * Process-wide key=value settings. Files use one "key=value" per line;
 * lines starting with '#' are comments. Typed getters fall back to the
 * supplied default when a key is missing or does not parse.
 */
class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    quantum::SimulationConfig getSimulationConfig() const;
    void setSimulationConfig(const quantum::SimulationConfig& config);
    LogConfig getLogConfig() const;

    void onChange(std::function<void(const std::string&)> callback);

    std::string getConfigPath() const;

private:
    Config();
    void store(const std::string& key, std::string value);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
