#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace ledger {
namespace utils {

struct SimulationConfig {
    uint32_t epochs = 10;
    uint32_t batchSize = 32;
    uint32_t wallets = 8;
    uint64_t seed = 1;
    double genesisValue = 1000.0;
    uint32_t genesisOutputs = 16;
    double conflictRate = 0.2;
    double invalidRate = 0.1;
    double duplicateRate = 0.05;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
};

class Config {
public:
    static Config& instance();

    // Reads `key=value` lines; blank lines and `#` comments are skipped.
    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;
    size_t size() const;

    // Fails on any sim.* value that is not a well-formed number in range.
    Result<SimulationConfig> getSimulationConfig() const;
    LogConfig getLogConfig() const;
    void setSimulationConfig(const SimulationConfig& config);
    void setLogConfig(const LogConfig& config);

    std::string getConfigPath() const;

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
