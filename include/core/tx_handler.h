#pragma once

#include "core/transaction.h"
#include "core/utxo_pool.h"
#include "crypto/crypto.h"
#include <vector>
#include <cstdint>

namespace ledger {
namespace core {

// Why checkTx() rejected a transaction, in the order the checks run.
enum class TxCheck : uint8_t {
    OK = 0,
    MALFORMED,
    BAD_INPUT,
    MISSING_UTXO,
    DOUBLE_SPEND,
    BAD_SOURCE_OUTPUT,
    BAD_SIGNATURE,
    BAD_OUTPUT,
    INSUFFICIENT_INPUT
};

const char* txCheckToString(TxCheck check);

struct HandlerStats {
    uint64_t epochs = 0;
    uint64_t candidates = 0;
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t duplicates = 0;
};

class TxHandler {
public:
    // Takes its own copy of `pool`. `verifier` must outlive the handler.
    explicit TxHandler(const UTXOPool& pool);
    TxHandler(const UTXOPool& pool, const crypto::SignatureVerifier& verifier);
    TxHandler(const UTXOPool& pool, const crypto::SignatureVerifier&& verifier) = delete;

    /**
     * True iff every input claims a distinct UTXO of the current pool that
     * carries a positive value and an owner, each input's signature
     * authorizes getRawDataToSign(i) under that owner, every output has a
     * positive value and an owner, and claimed value covers output value.
     */
    bool isValidTx(const Transaction& tx) const;
    TxCheck checkTx(const Transaction& tx) const;

    /**
     * Settles one epoch. Candidates are taken in the given order and each
     * is validated against the pool as left by the ones accepted before it,
     * so the first valid claimant of a UTXO wins. Returns the accepted
     * transactions in acceptance order, each at most once.
     */
    std::vector<Transaction> handleTxs(const std::vector<Transaction>& possibleTxs);

    const UTXOPool& getUTXOPool() const { return pool_; }
    HandlerStats getStats() const { return stats_; }

private:
    void apply(const Transaction& tx);

    UTXOPool pool_;
    const crypto::SignatureVerifier& verifier_;
    HandlerStats stats_;
};

}
}
