#include "core/transaction.h"
#include <cstring>
#include <algorithm>

namespace ledger {
namespace core {

static constexpr size_t MAX_TX_INPUTS = 1024;
static constexpr size_t MAX_TX_OUTPUTS = 1024;
static constexpr size_t INPUT_WIRE_SIZE = crypto::SHA256_SIZE + 4 + crypto::SIGNATURE_SIZE;
static constexpr size_t OUTPUT_WIRE_SIZE = 8 + crypto::PUBLIC_KEY_SIZE;

static void writeU64(std::vector<uint8_t>& out, uint64_t val) {
    for (int i = 0; i < 8; i++) out.push_back((val >> (i * 8)) & 0xff);
}

static uint64_t readU64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; i++) val |= static_cast<uint64_t>(p[i]) << (i * 8);
    return val;
}

static void writeU32(std::vector<uint8_t>& out, uint32_t val) {
    for (int i = 0; i < 4; i++) out.push_back((val >> (i * 8)) & 0xff);
}

static uint32_t readU32(const uint8_t* p) {
    uint32_t val = 0;
    for (int i = 0; i < 4; i++) val |= static_cast<uint32_t>(p[i]) << (i * 8);
    return val;
}

static void writeDouble(std::vector<uint8_t>& out, double val) {
    uint64_t bits = 0;
    std::memcpy(&bits, &val, sizeof(bits));
    writeU64(out, bits);
}

static double readDouble(const uint8_t* p) {
    uint64_t bits = readU64(p);
    double val = 0.0;
    std::memcpy(&val, &bits, sizeof(val));
    return val;
}

template<size_t N>
static void writeArray(std::vector<uint8_t>& out, const std::array<uint8_t, N>& arr) {
    out.insert(out.end(), arr.begin(), arr.end());
}

static void writeOutput(std::vector<uint8_t>& out, const TxOutput& outp) {
    writeDouble(out, outp.value);
    writeArray(out, outp.address);
}

void Transaction::addInput(const crypto::Hash256& prevTxHash, uint32_t outputIndex) {
    inputs_.emplace_back(prevTxHash, outputIndex);
}

void Transaction::addOutput(double value, const crypto::PublicKey& address) {
    outputs_.emplace_back(value, address);
}

bool Transaction::removeInput(size_t index) {
    if (index >= inputs_.size()) return false;
    inputs_.erase(inputs_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

bool Transaction::removeInput(const UTXO& utxo) {
    auto it = std::find_if(inputs_.begin(), inputs_.end(), [&](const TxInput& in) {
        return in.claimed() == utxo;
    });
    if (it == inputs_.end()) return false;
    inputs_.erase(it);
    return true;
}

bool Transaction::addSignature(const crypto::Signature& signature, size_t index) {
    if (index >= inputs_.size()) return false;
    inputs_[index].signature = signature;
    return true;
}

std::vector<uint8_t> Transaction::getRawDataToSign(size_t index) const {
    std::vector<uint8_t> out;
    if (index >= inputs_.size()) return out;

    const TxInput& in = inputs_[index];
    out.reserve(crypto::SHA256_SIZE + 4 + outputs_.size() * OUTPUT_WIRE_SIZE);
    writeArray(out, in.prevTxHash);
    writeU32(out, in.outputIndex);
    for (const auto& outp : outputs_) writeOutput(out, outp);
    return out;
}

std::vector<uint8_t> Transaction::getRawTx() const {
    std::vector<uint8_t> out;
    out.reserve(inputs_.size() * INPUT_WIRE_SIZE + outputs_.size() * OUTPUT_WIRE_SIZE);
    for (const auto& in : inputs_) {
        writeArray(out, in.prevTxHash);
        writeU32(out, in.outputIndex);
        writeArray(out, in.signature);
    }
    for (const auto& outp : outputs_) writeOutput(out, outp);
    return out;
}

void Transaction::finalize() {
    hash_ = crypto::sha256(getRawTx());
}

double Transaction::totalOutput() const {
    double total = 0.0;
    for (const auto& outp : outputs_) total += outp.value;
    return total;
}

std::vector<uint8_t> Transaction::serialize() const {
    std::vector<uint8_t> out;
    writeArray(out, hash_);
    writeU32(out, static_cast<uint32_t>(inputs_.size()));
    for (const auto& in : inputs_) {
        writeArray(out, in.prevTxHash);
        writeU32(out, in.outputIndex);
        writeArray(out, in.signature);
    }
    writeU32(out, static_cast<uint32_t>(outputs_.size()));
    for (const auto& outp : outputs_) writeOutput(out, outp);
    return out;
}

Transaction Transaction::deserialize(const std::vector<uint8_t>& data) {
    Transaction tx;
    const uint8_t* p = data.data();
    const uint8_t* end = data.data() + data.size();
    auto need = [&](size_t n) -> bool {
        return static_cast<size_t>(end - p) >= n;
    };

    if (!need(crypto::SHA256_SIZE + 4)) return Transaction{};
    std::memcpy(tx.hash_.data(), p, crypto::SHA256_SIZE);
    p += crypto::SHA256_SIZE;

    uint32_t inputCount = readU32(p);
    p += 4;
    if (inputCount > MAX_TX_INPUTS) return Transaction{};
    if (!need(static_cast<size_t>(inputCount) * INPUT_WIRE_SIZE)) return Transaction{};
    tx.inputs_.reserve(inputCount);
    for (uint32_t i = 0; i < inputCount; i++) {
        TxInput in;
        std::memcpy(in.prevTxHash.data(), p, crypto::SHA256_SIZE);
        p += crypto::SHA256_SIZE;
        in.outputIndex = readU32(p);
        p += 4;
        std::memcpy(in.signature.data(), p, crypto::SIGNATURE_SIZE);
        p += crypto::SIGNATURE_SIZE;
        tx.inputs_.push_back(in);
    }

    if (!need(4)) return Transaction{};
    uint32_t outputCount = readU32(p);
    p += 4;
    if (outputCount > MAX_TX_OUTPUTS) return Transaction{};
    if (!need(static_cast<size_t>(outputCount) * OUTPUT_WIRE_SIZE)) return Transaction{};
    tx.outputs_.reserve(outputCount);
    for (uint32_t i = 0; i < outputCount; i++) {
        TxOutput outp;
        outp.value = readDouble(p);
        p += 8;
        std::memcpy(outp.address.data(), p, crypto::PUBLIC_KEY_SIZE);
        p += crypto::PUBLIC_KEY_SIZE;
        tx.outputs_.push_back(outp);
    }

    if (p != end) return Transaction{};
    return tx;
}

}
}
