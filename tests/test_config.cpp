#include "utils/config.h"
#include "utils/logger.h"
#include "core/simulator.h"
#include "infrastructure/error_handling.h"
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using ledger::ErrorCode;
using ledger::core::EpochSimulator;
using ledger::utils::Config;
using ledger::utils::LogLevel;
using ledger::utils::Logger;
using ledger::utils::SimulationConfig;

static std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

static void testDefaults() {
    Config& config = Config::instance();
    config.reset();
    auto loaded = config.getSimulationConfig();
    assert(loaded.ok());
    SimulationConfig sim = loaded.value();
    SimulationConfig def;
    assert(sim.epochs == def.epochs);
    assert(sim.batchSize == def.batchSize);
    assert(sim.wallets == def.wallets);
    assert(sim.seed == def.seed);
    assert(sim.genesisValue == def.genesisValue);
    assert(sim.conflictRate == def.conflictRate);
    assert(sim.duplicateRate == def.duplicateRate);
    assert(config.getLogConfig().level == "info");
    assert(config.getLogConfig().console);
    assert(config.has("sim.invalid_rate"));
    assert(config.keys("log.").size() == 3);
}

static void testLoadFile() {
    std::string path = tempPath("ledgercore_test_config.conf");
    {
        std::ofstream out(path);
        out << "# settlement run\n";
        out << "\n";
        out << "sim.epochs = 25\n";
        out << "sim.seed=77\n";
        out << "  sim.conflict_rate=0.5  \n";
        out << "log.level=debug\n";
        out << "log.console=off\n";
        out << "not a pair\n";
        out << "custom.list = a, b ,,c\n";
    }

    Config& config = Config::instance();
    config.reset();
    assert(config.load(path));
    assert(config.getConfigPath() == path);

    SimulationConfig sim = config.getSimulationConfig().value();
    assert(sim.epochs == 25);
    assert(sim.seed == 77);
    assert(sim.conflictRate == 0.5);
    assert(sim.batchSize == SimulationConfig{}.batchSize);
    assert(config.getLogConfig().level == "debug");
    assert(!config.getLogConfig().console);

    auto list = config.getList("custom.list");
    assert(list.size() == 3);
    assert(list[0] == "a" && list[1] == "b" && list[2] == "c");
    assert(!config.has("not a pair"));

    std::remove(path.c_str());
    assert(!config.load(path));
}

static void testTypedAccess() {
    Config& config = Config::instance();
    config.reset();
    config.set("x.int", 42);
    config.set("x.big", static_cast<int64_t>(1) << 40);
    config.set("x.double", 0.1);
    config.set("x.flag", true);
    config.set("x.yes", "YES");
    config.set("x.accent", "\xC3\x89T\xC3\x89");
    config.set("x.text", "hello");
    config.set("x.bad", std::string("twelve"));

    assert(config.getInt("x.int") == 42);
    assert(config.getInt64("x.big") == (static_cast<int64_t>(1) << 40));
    assert(config.getDouble("x.double") == 0.1);
    assert(config.getBool("x.flag"));
    assert(config.getBool("x.yes"));
    assert(!config.getBool("x.accent", true));
    assert(config.getString("x.text") == "hello");
    assert(config.getInt("x.bad", -1) == -1);
    assert(config.getDouble("missing", 2.5) == 2.5);

    config.remove("x.int");
    assert(!config.has("x.int"));
    assert(config.getInt("x.int", 7) == 7);
}

static void testSaveAndReload() {
    std::string path = tempPath("ledgercore_saved.conf");
    Config& config = Config::instance();
    config.reset();

    SimulationConfig sim;
    sim.epochs = 3;
    sim.genesisValue = 123.25;
    sim.invalidRate = 0.3;
    sim.seed = 18446744073709551615ULL;
    config.setSimulationConfig(sim);
    assert(config.save(path));

    config.reset();
    assert(config.getSimulationConfig().value().epochs == SimulationConfig{}.epochs);
    assert(config.load(path));
    SimulationConfig loaded = config.getSimulationConfig().value();
    assert(loaded.epochs == 3);
    assert(loaded.genesisValue == 123.25);
    assert(loaded.invalidRate == 0.3);
    assert(loaded.seed == 18446744073709551615ULL);
    std::remove(path.c_str());
}

static void testSimulationValidation() {
    SimulationConfig ok;
    assert(EpochSimulator::validate(ok).ok());

    SimulationConfig noBatch;
    noBatch.batchSize = 0;
    auto r1 = EpochSimulator::validate(noBatch);
    assert(r1.failed());
    assert(r1.error().code == ErrorCode::INVALID_CONFIG);

    SimulationConfig oneWallet;
    oneWallet.wallets = 1;
    assert(EpochSimulator::validate(oneWallet).failed());

    SimulationConfig noGenesis;
    noGenesis.genesisOutputs = 0;
    assert(EpochSimulator::validate(noGenesis).failed());

    SimulationConfig badValue;
    badValue.genesisValue = -5.0;
    assert(EpochSimulator::validate(badValue).failed());

    SimulationConfig badRate;
    badRate.duplicateRate = 1.5;
    auto r2 = EpochSimulator::validate(badRate);
    assert(r2.failed());
    assert(r2.error().describe().find("[0, 1]") != std::string::npos);
}

static void expectRejected(const std::string& key, const std::string& value) {
    Config& config = Config::instance();
    config.reset();
    config.set(key, value);
    auto result = config.getSimulationConfig();
    assert(result.failed());
    assert(result.error().code == ErrorCode::INVALID_CONFIG);
    assert(result.error().context == key);
}

static void testCountsNeverWrap() {
    expectRejected("sim.epochs", "-1");
    expectRejected("sim.wallets", "-1");
    expectRejected("sim.batch_size", "4294967296");
    expectRejected("sim.genesis_outputs", "99999999999999999999999");
    expectRejected("sim.epochs", "12abc");
    expectRejected("sim.epochs", "1e3");
    expectRejected("sim.seed", "-7");
    expectRejected("sim.conflict_rate", "half");

    Config& config = Config::instance();
    config.reset();
    config.set("sim.batch_size", std::string("4294967295"));
    auto largest = config.getSimulationConfig();
    assert(largest.ok());
    assert(largest.value().batchSize == 4294967295u);
    // Representable, but far beyond what a run can allocate.
    assert(EpochSimulator::validate(largest.value()).failed());

    SimulationConfig manyWallets;
    manyWallets.wallets = 4294967295u;
    assert(EpochSimulator::validate(manyWallets).failed());
    SimulationConfig manyEpochs;
    manyEpochs.epochs = 4294967295u;
    assert(EpochSimulator::validate(manyEpochs).failed());
    config.reset();
}

static void testErrorDescription() {
    ledger::Error err = ledger::makeError(ErrorCode::FILE_NOT_FOUND, "cannot read run.conf", "run.conf");
    assert(err.describe() == "File not found: cannot read run.conf [run.conf]");
    assert(ledger::makeError(ErrorCode::IO_ERROR, "disk full").describe() == "I/O error: disk full");
    assert(std::string(ledger::errorToString(ErrorCode::AUDIT_FAILED)) == "Audit failed");

    ledger::Result<int> good(3);
    assert(good.ok() && good.value() == 3);
    ledger::Result<int> bad(err);
    assert(bad.failed() && bad.error().code == ErrorCode::FILE_NOT_FOUND);
}

static void testLogLevels() {
    LogLevel level = LogLevel::INFO;
    assert(Logger::parseLevel("debug", level) && level == LogLevel::DEBUG);
    assert(Logger::parseLevel("WARN", level) && level == LogLevel::WARN);
    assert(Logger::parseLevel("off", level) && level == LogLevel::OFF);
    assert(!Logger::parseLevel("loud", level));
    assert(level == LogLevel::OFF);
    assert(std::string(Logger::levelName(LogLevel::ERROR)) == "ERROR");

    Logger::enableConsole(false);
    Logger::setLevel(LogLevel::WARN);
    Logger::clearLogs();
    LOG_INFO("filtered");
    LOG_WARN("kept");
    auto logs = Logger::getRecentLogs();
    assert(logs.size() == 1);
    assert(logs[0].message == "kept");
    assert(logs[0].level == LogLevel::WARN);
    Logger::setLevel(LogLevel::INFO);
    Logger::enableConsole(true);
}

static void testLogFile() {
    std::string path = tempPath("ledgercore_test.log");
    std::remove(path.c_str());
    Logger::enableConsole(false);
    assert(Logger::init(path));
    assert(Logger::isInitialized());
    assert(Logger::getLogPath() == path);
    LOG_INFO("written to file");
    Logger::flush();
    Logger::shutdown();

    std::ifstream in(path);
    std::string line;
    assert(std::getline(in, line));
    assert(line.find("[INFO") != std::string::npos);
    assert(line.find("written to file") != std::string::npos);
    std::remove(path.c_str());
    Logger::enableConsole(true);
}

int main() {
    testDefaults();
    testLoadFile();
    testTypedAccess();
    testSaveAndReload();
    testSimulationValidation();
    testCountsNeverWrap();
    testErrorDescription();
    testLogLevels();
    testLogFile();
    return 0;
}
