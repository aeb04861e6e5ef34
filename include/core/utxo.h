#pragma once

#include "crypto/crypto.h"
#include <cstdint>
#include <cstddef>
#include <string>

namespace ledger {
namespace core {

// Names one spendable output: the producing transaction's hash plus the
// output's position in that transaction.
class UTXO {
public:
    UTXO(const crypto::Hash256& txHash, uint32_t index) : txHash_(txHash), index_(index) {}

    const crypto::Hash256& getTxHash() const { return txHash_; }
    uint32_t getIndex() const { return index_; }

    bool operator==(const UTXO& other) const {
        return index_ == other.index_ && txHash_ == other.txHash_;
    }
    bool operator!=(const UTXO& other) const { return !(*this == other); }
    bool operator<(const UTXO& other) const {
        if (txHash_ != other.txHash_) return txHash_ < other.txHash_;
        return index_ < other.index_;
    }

    std::string toString() const {
        return crypto::toHex(txHash_) + ":" + std::to_string(index_);
    }

private:
    crypto::Hash256 txHash_;
    uint32_t index_;
};

struct UTXOHasher {
    size_t operator()(const UTXO& utxo) const {
        // Transaction hashes are already uniformly distributed.
        const crypto::Hash256& h = utxo.getTxHash();
        uint64_t v = 0;
        for (int i = 0; i < 8; i++) v |= static_cast<uint64_t>(h[i]) << (i * 8);
        v ^= static_cast<uint64_t>(utxo.getIndex()) * 0x9e3779b97f4a7c15ULL;
        return static_cast<size_t>(v);
    }
};

}
}
