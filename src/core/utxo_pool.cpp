#include "core/utxo_pool.h"
#include <algorithm>

namespace ledger {
namespace core {

void UTXOPool::addUTXO(const UTXO& utxo, const TxOutput& output) {
    utxos_.insert_or_assign(utxo, output);
}

bool UTXOPool::removeUTXO(const UTXO& utxo) {
    return utxos_.erase(utxo) > 0;
}

bool UTXOPool::contains(const UTXO& utxo) const {
    return utxos_.find(utxo) != utxos_.end();
}

std::optional<TxOutput> UTXOPool::getTxOutput(const UTXO& utxo) const {
    auto it = utxos_.find(utxo);
    if (it == utxos_.end()) return std::nullopt;
    return it->second;
}

std::vector<UTXO> UTXOPool::getAllUTXO() const {
    std::vector<UTXO> result;
    result.reserve(utxos_.size());
    for (const auto& [utxo, _] : utxos_) {
        result.push_back(utxo);
    }
    std::sort(result.begin(), result.end());
    return result;
}

double UTXOPool::totalValue() const {
    double total = 0.0;
    for (const auto& [_, output] : utxos_) {
        total += output.value;
    }
    return total;
}

}
}
