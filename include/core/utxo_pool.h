#pragma once

#include "core/utxo.h"
#include "core/transaction.h"
#include <unordered_map>
#include <optional>
#include <vector>
#include <cstddef>

namespace ledger {
namespace core {

// Current set of spendable outputs. Copies are deep: a copied pool shares
// no state with its source.
class UTXOPool {
public:
    UTXOPool() = default;
    UTXOPool(const UTXOPool& other) = default;
    UTXOPool& operator=(const UTXOPool& other) = default;
    UTXOPool(UTXOPool&& other) = default;
    UTXOPool& operator=(UTXOPool&& other) = default;

    // Inserts or overwrites; the caller derives `utxo` from a real output.
    void addUTXO(const UTXO& utxo, const TxOutput& output);
    // Returns false if `utxo` was not present.
    bool removeUTXO(const UTXO& utxo);

    bool contains(const UTXO& utxo) const;
    std::optional<TxOutput> getTxOutput(const UTXO& utxo) const;
    std::vector<UTXO> getAllUTXO() const;

    size_t size() const { return utxos_.size(); }
    bool empty() const { return utxos_.empty(); }
    double totalValue() const;
    void clear() { utxos_.clear(); }

private:
    std::unordered_map<UTXO, TxOutput, UTXOHasher> utxos_;
};

}
}
