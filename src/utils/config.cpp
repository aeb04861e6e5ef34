#include "utils/config.h"
#include <cctype>
#include <limits>
#include <initializer_list>
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace ledger {
namespace utils {

struct Config::Impl {
    std::map<std::string, std::string> data;
    std::string configPath;
    mutable std::mutex mtx;

    const std::string* find(const std::string& key) const {
        auto it = data.find(key);
        return it != data.end() ? &it->second : nullptr;
    }
};

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    setSimulationConfig(SimulationConfig{});
    setLogConfig(LogConfig{});
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
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto pos = trimmed.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(trimmed.substr(0, pos));
        if (key.empty()) continue;
        impl_->data[key] = trim(trimmed.substr(pos + 1));
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# LedgerCore configuration\n\n";

    std::string lastPrefix;
    for (const auto& [key, value] : impl_->data) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << value << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const std::string* v = impl_->find(key);
    return v ? *v : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const std::string* v = impl_->find(key);
    if (!v) return def;
    try { return std::stoi(*v); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const std::string* v = impl_->find(key);
    if (!v) return def;
    try { return std::stoll(*v); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const std::string* v = impl_->find(key);
    if (!v) return def;
    try { return std::stod(*v); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const std::string* v = impl_->find(key);
    if (!v) return def;
    std::string val = *v;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    const std::string* v = impl_->find(key);
    if (!v) return result;

    std::istringstream iss(*v);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value;
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss.precision(17);
    oss << value;
    set(key, oss.str());
}

void Config::set(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.erase(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    return result;
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

// Accepts only plain decimal digits, so "-1" or "1e3" never wrap or truncate.
static bool parseCount(const std::string& text, uint64_t max, uint64_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        unsigned long long v = std::stoull(text);
        if (v > max) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseReal(const std::string& text, double& out) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

Result<SimulationConfig> Config::getSimulationConfig() const {
    SimulationConfig cfg;
    const uint64_t maxU32 = std::numeric_limits<uint32_t>::max();

    for (const auto& [key, field] : {std::make_pair("sim.epochs", &cfg.epochs),
                                     std::make_pair("sim.batch_size", &cfg.batchSize),
                                     std::make_pair("sim.wallets", &cfg.wallets),
                                     std::make_pair("sim.genesis_outputs", &cfg.genesisOutputs)}) {
        if (!has(key)) continue;
        std::string text = getString(key);
        uint64_t v = 0;
        if (!parseCount(text, maxU32, v)) {
            return makeError(ErrorCode::INVALID_CONFIG, "expected an integer in [0, 4294967295], got '" + text + "'", key);
        }
        *field = static_cast<uint32_t>(v);
    }

    if (has("sim.seed")) {
        std::string text = getString("sim.seed");
        if (!parseCount(text, std::numeric_limits<uint64_t>::max(), cfg.seed)) {
            return makeError(ErrorCode::INVALID_CONFIG, "expected a non-negative integer, got '" + text + "'", "sim.seed");
        }
    }

    for (const auto& [key, field] : {std::make_pair("sim.genesis_value", &cfg.genesisValue),
                                     std::make_pair("sim.conflict_rate", &cfg.conflictRate),
                                     std::make_pair("sim.invalid_rate", &cfg.invalidRate),
                                     std::make_pair("sim.duplicate_rate", &cfg.duplicateRate)}) {
        if (!has(key)) continue;
        std::string text = getString(key);
        if (!parseReal(text, *field)) {
            return makeError(ErrorCode::INVALID_CONFIG, "expected a number, got '" + text + "'", key);
        }
    }
    return cfg;
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", cfg.level);
    cfg.file = getString("log.file", cfg.file);
    cfg.console = getBool("log.console", cfg.console);
    return cfg;
}

void Config::setSimulationConfig(const SimulationConfig& cfg) {
    set("sim.epochs", static_cast<int64_t>(cfg.epochs));
    set("sim.batch_size", static_cast<int64_t>(cfg.batchSize));
    set("sim.wallets", static_cast<int64_t>(cfg.wallets));
    set("sim.seed", std::to_string(cfg.seed));
    set("sim.genesis_value", cfg.genesisValue);
    set("sim.genesis_outputs", static_cast<int64_t>(cfg.genesisOutputs));
    set("sim.conflict_rate", cfg.conflictRate);
    set("sim.invalid_rate", cfg.invalidRate);
    set("sim.duplicate_rate", cfg.duplicateRate);
}

void Config::setLogConfig(const LogConfig& cfg) {
    set("log.level", cfg.level);
    set("log.file", cfg.file);
    set("log.console", cfg.console);
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

}
}
