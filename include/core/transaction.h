#pragma once

#include "crypto/crypto.h"
#include "core/utxo.h"
#include <string>
#include <vector>
#include <cstdint>

namespace ledger {
namespace core {

// An all-zero prevTxHash or signature means the field was never set.
struct TxInput {
    crypto::Hash256 prevTxHash{};
    uint32_t outputIndex = 0;
    crypto::Signature signature{};

    TxInput() = default;
    TxInput(const crypto::Hash256& prevHash, uint32_t index) : prevTxHash(prevHash), outputIndex(index) {}

    UTXO claimed() const { return UTXO(prevTxHash, outputIndex); }
    bool hasSignature() const { return !crypto::isNull(signature); }
};

struct TxOutput {
    double value = 0.0;
    crypto::PublicKey address{};

    TxOutput() = default;
    TxOutput(double v, const crypto::PublicKey& addr) : value(v), address(addr) {}

    bool operator==(const TxOutput& other) const {
        return value == other.value && address == other.address;
    }
};

class Transaction {
public:
    Transaction() = default;

    void addInput(const crypto::Hash256& prevTxHash, uint32_t outputIndex);
    void addOutput(double value, const crypto::PublicKey& address);
    bool removeInput(size_t index);
    bool removeInput(const UTXO& utxo);
    bool addSignature(const crypto::Signature& signature, size_t index);

    // Canonical payload authorized by input `index`: the claimed outpoint
    // followed by every output. Empty if `index` is out of range.
    std::vector<uint8_t> getRawDataToSign(size_t index) const;
    std::vector<uint8_t> getRawTx() const;

    // Seals the content hash. Must be called after all inputs are signed.
    void finalize();
    void setHash(const crypto::Hash256& hash) { hash_ = hash; }

    const crypto::Hash256& getHash() const { return hash_; }
    bool hasHash() const { return !crypto::isNull(hash_); }

    const std::vector<TxInput>& getInputs() const { return inputs_; }
    const std::vector<TxOutput>& getOutputs() const { return outputs_; }
    const TxInput& getInput(size_t index) const { return inputs_.at(index); }
    const TxOutput& getOutput(size_t index) const { return outputs_.at(index); }
    size_t numInputs() const { return inputs_.size(); }
    size_t numOutputs() const { return outputs_.size(); }
    double totalOutput() const;

    std::vector<uint8_t> serialize() const;
    static Transaction deserialize(const std::vector<uint8_t>& data);

    bool operator==(const Transaction& other) const { return hash_ == other.hash_; }
    bool operator!=(const Transaction& other) const { return !(*this == other); }

private:
    crypto::Hash256 hash_{};
    std::vector<TxInput> inputs_;
    std::vector<TxOutput> outputs_;
};

}
}
