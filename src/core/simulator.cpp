#include "core/simulator.h"
#include "utils/logger.h"
#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace ledger {
namespace core {

static constexpr double FEE_SHARE = 0.01;
static constexpr double VALUE_EPSILON = 1e-9;
static constexpr uint32_t MAX_EPOCHS = 1000000;
static constexpr uint32_t MAX_BATCH_SIZE = 100000;
static constexpr uint32_t MAX_WALLETS = 10000;
static constexpr uint32_t MAX_GENESIS_OUTPUTS = 100000;

static crypto::Hash256 labelHash(const std::string& label, uint64_t seed, uint64_t n) {
    return crypto::sha256(label + ":" + std::to_string(seed) + ":" + std::to_string(n));
}

Result<void> EpochSimulator::validate(const utils::SimulationConfig& config) {
    LEDGER_CHECK(config.epochs <= MAX_EPOCHS, ErrorCode::INVALID_CONFIG, "sim.epochs must not exceed 1000000");
    LEDGER_CHECK(config.batchSize > 0 && config.batchSize <= MAX_BATCH_SIZE, ErrorCode::INVALID_CONFIG,
                 "sim.batch_size must lie in [1, 100000]");
    LEDGER_CHECK(config.wallets >= 2 && config.wallets <= MAX_WALLETS, ErrorCode::INVALID_CONFIG,
                 "sim.wallets must lie in [2, 10000]");
    LEDGER_CHECK(config.genesisOutputs > 0 && config.genesisOutputs <= MAX_GENESIS_OUTPUTS,
                 ErrorCode::INVALID_CONFIG, "sim.genesis_outputs must lie in [1, 100000]");
    LEDGER_CHECK(std::isfinite(config.genesisValue) && config.genesisValue > 0.0,
                 ErrorCode::INVALID_CONFIG, "sim.genesis_value must be positive");
    for (double rate : {config.conflictRate, config.invalidRate, config.duplicateRate}) {
        LEDGER_CHECK(rate >= 0.0 && rate <= 1.0, ErrorCode::INVALID_CONFIG, "sim rates must lie in [0, 1]");
    }
    return Result<void>();
}

EpochSimulator::EpochSimulator(const utils::SimulationConfig& config)
    : config_(config), rng_(config.seed) {
    wallets_.reserve(config_.wallets);
    for (uint32_t i = 0; i < config_.wallets; ++i) {
        crypto::KeyPair kp = crypto::keyPairFromSeed(labelHash("wallet", config_.seed, i));
        walletIndex_[kp.publicKey] = i;
        wallets_.push_back(kp);
    }

    UTXOPool genesis;
    crypto::Hash256 genesisHash = labelHash("genesis", config_.seed, 0);
    double share = config_.genesisValue / config_.genesisOutputs;
    for (uint32_t i = 0; i < config_.genesisOutputs; ++i) {
        genesis.addUTXO(UTXO(genesisHash, i), TxOutput(share, wallets_[i % wallets_.size()].publicKey));
    }
    handler_ = std::make_unique<TxHandler>(genesis);
}

double EpochSimulator::uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

bool EpochSimulator::chance(double p) {
    if (p <= 0.0) return false;
    return uniform(0.0, 1.0) < p;
}

size_t EpochSimulator::pickWallet() {
    std::uniform_int_distribution<size_t> dist(0, wallets_.size() - 1);
    return dist(rng_);
}

const crypto::KeyPair* EpochSimulator::ownerOf(const UTXO& utxo) const {
    auto output = handler_->getUTXOPool().getTxOutput(utxo);
    if (!output) return nullptr;
    auto it = walletIndex_.find(output->address);
    if (it == walletIndex_.end()) return nullptr;
    return &wallets_[it->second];
}

Transaction EpochSimulator::makeTransfer(const std::vector<UTXO>& inputs, size_t recipient, double payShare) {
    const UTXOPool& pool = handler_->getUTXOPool();
    const crypto::KeyPair* owner = ownerOf(inputs.front());

    Transaction tx;
    double total = 0.0;
    for (const auto& utxo : inputs) {
        tx.addInput(utxo.getTxHash(), utxo.getIndex());
        total += pool.getTxOutput(utxo)->value;
    }

    double spendable = total * (1.0 - FEE_SHARE);
    double pay = spendable * payShare;
    tx.addOutput(pay, wallets_[recipient].publicKey);
    if (spendable - pay > VALUE_EPSILON) {
        tx.addOutput(spendable - pay, owner->publicKey);
    }

    for (size_t i = 0; i < tx.numInputs(); ++i) {
        tx.addSignature(crypto::signMessage(tx.getRawDataToSign(i), owner->privateKey), i);
    }
    tx.finalize();
    return tx;
}

Transaction EpochSimulator::makeInvalid(const UTXO& input) {
    const crypto::KeyPair* owner = ownerOf(input);
    double value = handler_->getUTXOPool().getTxOutput(input)->value;
    std::uniform_int_distribution<int> kindDist(0, 3);
    int kind = kindDist(rng_);

    Transaction tx;
    const crypto::KeyPair* signer = owner;
    switch (kind) {
        case 0:
            // Signed by a key that does not own the input.
            signer = &wallets_[(walletIndex_.at(owner->publicKey) + 1) % wallets_.size()];
            tx.addInput(input.getTxHash(), input.getIndex());
            tx.addOutput(value / 2, wallets_[pickWallet()].publicKey);
            break;
        case 1:
            tx.addInput(input.getTxHash(), input.getIndex());
            tx.addOutput(value / 2, wallets_[pickWallet()].publicKey);
            tx.addOutput(0.0, wallets_[pickWallet()].publicKey);
            break;
        case 2:
            tx.addInput(input.getTxHash(), input.getIndex());
            tx.addOutput(value * 2, wallets_[pickWallet()].publicKey);
            break;
        default:
            tx.addInput(labelHash("unknown", config_.seed, nonce_++), 0);
            tx.addOutput(value / 2, wallets_[pickWallet()].publicKey);
            break;
    }

    for (size_t i = 0; i < tx.numInputs(); ++i) {
        tx.addSignature(crypto::signMessage(tx.getRawDataToSign(i), signer->privateKey), i);
    }
    tx.finalize();
    return tx;
}

bool EpochSimulator::audit(const UTXOPool& before, const std::vector<Transaction>& accepted, EpochReport& report) {
    bool ok = true;
    double fees = 0.0;

    for (const auto& tx : accepted) {
        double in = 0.0;
        for (const auto& input : tx.getInputs()) {
            UTXO utxo = input.claimed();
            auto source = before.getTxOutput(utxo);
            if (!source) {
                LOG_ERROR("audit: accepted tx spends output absent before the epoch: " + utxo.toString());
                ok = false;
                continue;
            }
            if (!everClaimed_.insert(utxo).second) {
                LOG_ERROR("audit: output claimed twice: " + utxo.toString());
                ok = false;
            }
            in += source->value;
        }
        double out = tx.totalOutput();
        if (in + VALUE_EPSILON < out) {
            LOG_ERROR("audit: accepted tx creates value: " + crypto::toHex(tx.getHash()));
            ok = false;
        }
        fees += in - out;
    }

    const UTXOPool& after = handler_->getUTXOPool();
    if (after.totalValue() > before.totalValue() + VALUE_EPSILON) {
        LOG_ERROR("audit: pool value grew from " + std::to_string(before.totalValue()) +
                  " to " + std::to_string(after.totalValue()));
        ok = false;
    }

    report.fees = fees;
    return ok;
}

EpochReport EpochSimulator::runEpoch() {
    EpochReport report;
    report.epoch = ++epoch_;

    const UTXOPool before = handler_->getUTXOPool();
    std::vector<UTXO> available = before.getAllUTXO();
    std::shuffle(available.begin(), available.end(), rng_);

    std::vector<Transaction> batch;
    size_t next = 0;
    while (batch.size() < config_.batchSize && next < available.size()) {
        std::vector<UTXO> inputs{available[next++]};
        const crypto::KeyPair* owner = ownerOf(inputs.front());
        if (!owner) continue;

        // Occasionally merge a second output held by the same owner.
        if (next < available.size() && ownerOf(available[next]) == owner && chance(0.5)) {
            inputs.push_back(available[next++]);
        }

        double share = uniform(0.2, 0.8);
        batch.push_back(makeTransfer(inputs, pickWallet(), share));

        if (chance(config_.conflictRate)) {
            double other = share < 0.5 ? share + 0.15 : share - 0.15;
            batch.push_back(makeTransfer(inputs, pickWallet(), other));
            report.conflictsInjected++;
        }
        if (chance(config_.invalidRate)) {
            batch.push_back(makeInvalid(inputs.front()));
            report.invalidInjected++;
        }
        if (chance(config_.duplicateRate)) {
            batch.push_back(batch.back());
            report.duplicatesInjected++;
        }
    }
    std::shuffle(batch.begin(), batch.end(), rng_);

    std::vector<Transaction> accepted = handler_->handleTxs(batch);

    report.candidates = batch.size();
    report.accepted = accepted.size();
    report.rejected = batch.size() - accepted.size();
    report.poolSize = handler_->getUTXOPool().size();
    report.poolValue = handler_->getUTXOPool().totalValue();
    report.auditOk = audit(before, accepted, report);
    if (!report.auditOk) auditOk_ = false;

    LOG_INFO("epoch " + std::to_string(report.epoch) + ": " + std::to_string(report.accepted) + "/" +
             std::to_string(report.candidates) + " accepted, pool " + std::to_string(report.poolSize) +
             " utxos worth " + std::to_string(report.poolValue));
    return report;
}

std::vector<EpochReport> EpochSimulator::run() {
    std::vector<EpochReport> reports;
    reports.reserve(config_.epochs);
    for (uint32_t i = 0; i < config_.epochs; ++i) {
        reports.push_back(runEpoch());
    }
    return reports;
}

}
}
