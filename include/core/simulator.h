#pragma once

#include "core/tx_handler.h"
#include "core/utxo_pool.h"
#include "crypto/crypto.h"
#include "utils/config.h"
#include "infrastructure/error_handling.h"
#include <vector>
#include <map>
#include <unordered_set>
#include <random>
#include <memory>
#include <cstdint>

namespace ledger {
namespace core {

struct EpochReport {
    uint32_t epoch = 0;
    size_t candidates = 0;
    size_t accepted = 0;
    size_t rejected = 0;
    size_t conflictsInjected = 0;
    size_t invalidInjected = 0;
    size_t duplicatesInjected = 0;
    size_t poolSize = 0;
    double poolValue = 0.0;
    double fees = 0.0;
    bool auditOk = true;
};

// Drives a TxHandler through epochs of generated transfers between a fixed
// set of wallets. Batches deliberately mix in conflicting spends, invalid
// transactions and duplicates; every settlement is audited afterwards.
class EpochSimulator {
public:
    explicit EpochSimulator(const utils::SimulationConfig& config);

    static Result<void> validate(const utils::SimulationConfig& config);

    EpochReport runEpoch();
    std::vector<EpochReport> run();

    const TxHandler& handler() const { return *handler_; }
    const std::vector<crypto::KeyPair>& wallets() const { return wallets_; }
    bool auditPassed() const { return auditOk_; }

private:
    Transaction makeTransfer(const std::vector<UTXO>& inputs, size_t recipient, double payShare);
    Transaction makeInvalid(const UTXO& input);
    const crypto::KeyPair* ownerOf(const UTXO& utxo) const;
    bool audit(const UTXOPool& before, const std::vector<Transaction>& accepted, EpochReport& report);
    double uniform(double lo, double hi);
    bool chance(double p);
    size_t pickWallet();

    utils::SimulationConfig config_;
    std::mt19937_64 rng_;
    std::vector<crypto::KeyPair> wallets_;
    std::map<crypto::PublicKey, size_t> walletIndex_;
    std::unique_ptr<TxHandler> handler_;
    std::unordered_set<UTXO, UTXOHasher> everClaimed_;
    uint32_t epoch_ = 0;
    uint64_t nonce_ = 0;
    bool auditOk_ = true;
};

}
}
