#include "core/simulator.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "infrastructure/error_handling.h"
#include <getopt.h>
#include <iostream>
#include <iomanip>
#include <string>
#include <utility>
#include <initializer_list>

namespace ledger {

struct CliOptions {
    bool showHelp = false;
    bool showVersion = false;
    std::string configPath;
    std::string epochs;
    std::string batchSize;
    std::string seed;
    std::string logLevel;
    std::string logFile;
};

void printHelp(const char* progName) {
    std::cout << "LedgerCore v0.1.0 - UTXO transaction settlement engine\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Runs a deterministic multi-epoch settlement simulation and audits every epoch.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -v, --version         Show version\n";
    std::cout << "  -c, --config FILE     Load key=value configuration\n";
    std::cout << "  -e, --epochs N        Number of epochs (sim.epochs)\n";
    std::cout << "  -b, --batch N         Transfers per epoch (sim.batch_size)\n";
    std::cout << "  -s, --seed N          RNG and wallet seed (sim.seed)\n";
    std::cout << "  -l, --loglevel LEVEL  trace|debug|info|warn|error|off\n";
    std::cout << "  -L, --logfile FILE    Append log output to FILE\n";
    std::cout << "\nExit status: 0 audits passed, 1 usage or configuration error, 2 audit failure\n";
}

void printVersion() {
    std::cout << "LedgerCore v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
    std::cout << "Crypto: libsecp256k1\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"epochs", required_argument, nullptr, 'e'},
        {"batch", required_argument, nullptr, 'b'},
        {"seed", required_argument, nullptr, 's'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"logfile", required_argument, nullptr, 'L'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hvc:e:b:s:l:L:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                options.showHelp = true;
                return true;
            case 'v':
                options.showVersion = true;
                return true;
            case 'c':
                options.configPath = optarg;
                break;
            case 'e':
                options.epochs = optarg;
                break;
            case 'b':
                options.batchSize = optarg;
                break;
            case 's':
                options.seed = optarg;
                break;
            case 'l':
                options.logLevel = optarg;
                break;
            case 'L':
                options.logFile = optarg;
                break;
            default:
                return false;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

Result<utils::SimulationConfig> buildConfig(const CliOptions& options) {
    utils::Config& config = utils::Config::instance();
    if (!options.configPath.empty() && !config.load(options.configPath)) {
        return makeError(ErrorCode::FILE_NOT_FOUND, "cannot read " + options.configPath);
    }

    // Overrides are stored verbatim and checked with the file's values below.
    for (const auto& [key, text] : {std::make_pair("sim.epochs", options.epochs),
                                    std::make_pair("sim.batch_size", options.batchSize),
                                    std::make_pair("sim.seed", options.seed)}) {
        if (!text.empty()) config.set(key, text);
    }
    if (!options.logLevel.empty()) config.set("log.level", options.logLevel);
    if (!options.logFile.empty()) config.set("log.file", options.logFile);

    utils::LogConfig logCfg = config.getLogConfig();
    utils::LogLevel level = utils::LogLevel::INFO;
    LEDGER_CHECK(utils::Logger::parseLevel(logCfg.level, level), ErrorCode::INVALID_CONFIG,
                 "unknown log level: " + logCfg.level);
    utils::Logger::setLevel(level);
    utils::Logger::enableConsole(logCfg.console);
    if (!logCfg.file.empty() && !utils::Logger::init(logCfg.file)) {
        return makeError(ErrorCode::IO_ERROR, "cannot open log file " + logCfg.file);
    }

    Result<utils::SimulationConfig> simCfg = config.getSimulationConfig();
    if (simCfg.failed()) return simCfg;
    Result<void> valid = core::EpochSimulator::validate(simCfg.value());
    if (valid.failed()) return valid.error();
    return simCfg;
}

int run(const utils::SimulationConfig& simCfg) {
    LOG_INFO("starting simulation: " + std::to_string(simCfg.epochs) + " epochs, batch " +
             std::to_string(simCfg.batchSize) + ", seed " + std::to_string(simCfg.seed));

    core::EpochSimulator sim(simCfg);
    std::cout << std::fixed << std::setprecision(6);
    for (uint32_t i = 0; i < simCfg.epochs; ++i) {
        core::EpochReport r = sim.runEpoch();
        std::cout << "epoch " << r.epoch
                  << " candidates=" << r.candidates
                  << " accepted=" << r.accepted
                  << " rejected=" << r.rejected
                  << " conflicts=" << r.conflictsInjected
                  << " invalid=" << r.invalidInjected
                  << " duplicates=" << r.duplicatesInjected
                  << " pool=" << r.poolSize
                  << " value=" << r.poolValue
                  << " fees=" << r.fees
                  << (r.auditOk ? " audit=ok" : " audit=FAILED") << "\n";
    }

    core::HandlerStats stats = sim.handler().getStats();
    LOG_INFO("settled " + std::to_string(stats.accepted) + " of " + std::to_string(stats.candidates) +
             " candidates (" + std::to_string(stats.duplicates) + " duplicates suppressed)");
    utils::Logger::flush();

    if (!sim.auditPassed()) {
        LOG_ERROR(errorToString(ErrorCode::AUDIT_FAILED));
        return 2;
    }
    return 0;
}

}

int main(int argc, char* argv[]) {
    ledger::CliOptions options;
    if (!ledger::parseArgs(argc, argv, options)) {
        ledger::printHelp(argv[0]);
        return 1;
    }
    if (options.showHelp) {
        ledger::printHelp(argv[0]);
        return 0;
    }
    if (options.showVersion) {
        ledger::printVersion();
        return 0;
    }

    auto config = ledger::buildConfig(options);
    if (config.failed()) {
        std::cerr << "Error: " << config.error().describe() << "\n";
        return 1;
    }

    int rc = ledger::run(config.value());
    ledger::utils::Logger::shutdown();
    return rc;
}
