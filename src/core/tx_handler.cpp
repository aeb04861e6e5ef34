#include "core/tx_handler.h"
#include "utils/logger.h"
#include <unordered_set>
#include <set>
#include <cmath>

namespace ledger {
namespace core {

const char* txCheckToString(TxCheck check) {
    switch (check) {
        case TxCheck::OK: return "ok";
        case TxCheck::MALFORMED: return "malformed";
        case TxCheck::BAD_INPUT: return "bad-input";
        case TxCheck::MISSING_UTXO: return "missing-utxo";
        case TxCheck::DOUBLE_SPEND: return "double-spend";
        case TxCheck::BAD_SOURCE_OUTPUT: return "bad-source-output";
        case TxCheck::BAD_SIGNATURE: return "bad-signature";
        case TxCheck::BAD_OUTPUT: return "bad-output";
        case TxCheck::INSUFFICIENT_INPUT: return "insufficient-input";
    }
    return "unknown";
}

static bool isSpendableOutput(const TxOutput& output) {
    return !crypto::isNull(output.address) && output.value > 0.0 && std::isfinite(output.value);
}

TxHandler::TxHandler(const UTXOPool& pool)
    : TxHandler(pool, crypto::Secp256k1Verifier::instance()) {}

TxHandler::TxHandler(const UTXOPool& pool, const crypto::SignatureVerifier& verifier)
    : pool_(pool), verifier_(verifier) {}

bool TxHandler::isValidTx(const Transaction& tx) const {
    return checkTx(tx) == TxCheck::OK;
}

TxCheck TxHandler::checkTx(const Transaction& tx) const {
    if (!tx.hasHash()) return TxCheck::MALFORMED;

    std::unordered_set<UTXO, UTXOHasher> claimed;
    claimed.reserve(tx.numInputs());
    double inputValue = 0.0;

    for (size_t i = 0; i < tx.numInputs(); ++i) {
        const TxInput& in = tx.getInput(i);
        if (crypto::isNull(in.prevTxHash) || !in.hasSignature()) return TxCheck::BAD_INPUT;

        UTXO utxo = in.claimed();
        auto source = pool_.getTxOutput(utxo);
        if (!source) return TxCheck::MISSING_UTXO;
        if (!claimed.insert(utxo).second) return TxCheck::DOUBLE_SPEND;
        if (!isSpendableOutput(*source)) return TxCheck::BAD_SOURCE_OUTPUT;

        std::vector<uint8_t> payload = tx.getRawDataToSign(i);
        if (payload.empty() || !verifier_.verify(source->address, payload, in.signature)) {
            return TxCheck::BAD_SIGNATURE;
        }
        inputValue += source->value;
    }

    double outputValue = 0.0;
    for (const auto& out : tx.getOutputs()) {
        if (!isSpendableOutput(out)) return TxCheck::BAD_OUTPUT;
        outputValue += out.value;
    }

    // Any surplus is an implicit fee and is not tracked.
    if (inputValue < outputValue) return TxCheck::INSUFFICIENT_INPUT;
    return TxCheck::OK;
}

void TxHandler::apply(const Transaction& tx) {
    for (const auto& in : tx.getInputs()) {
        pool_.removeUTXO(in.claimed());
    }
    for (size_t i = 0; i < tx.numOutputs(); ++i) {
        pool_.addUTXO(UTXO(tx.getHash(), static_cast<uint32_t>(i)), tx.getOutput(i));
    }
}

std::vector<Transaction> TxHandler::handleTxs(const std::vector<Transaction>& possibleTxs) {
    std::vector<Transaction> accepted;
    std::set<crypto::Hash256> acceptedHashes;
    stats_.epochs++;

    for (const auto& tx : possibleTxs) {
        stats_.candidates++;
        if (tx.hasHash() && acceptedHashes.count(tx.getHash()) > 0) {
            stats_.duplicates++;
            continue;
        }

        TxCheck check = checkTx(tx);
        if (check != TxCheck::OK) {
            stats_.rejected++;
            LOG_DEBUG("rejected tx " + crypto::toHex(tx.getHash()).substr(0, 16) + ": " + txCheckToString(check));
            continue;
        }

        apply(tx);
        acceptedHashes.insert(tx.getHash());
        accepted.push_back(tx);
        stats_.accepted++;
    }

    utils::Logger::log(utils::LogLevel::DEBUG, "settle",
        "epoch " + std::to_string(stats_.epochs) + ": accepted " + std::to_string(accepted.size()) +
        "/" + std::to_string(possibleTxs.size()) + ", pool size " + std::to_string(pool_.size()));
    return accepted;
}

}
}
