#include "core/transaction.h"
#include "crypto/crypto.h"
#include <cassert>
#include <string>
#include <vector>

using ledger::core::Transaction;
using ledger::core::UTXO;

static ledger::crypto::KeyPair keysFor(const std::string& name) {
    return ledger::crypto::keyPairFromSeed(ledger::crypto::sha256(name));
}

static Transaction sampleTx() {
    auto alice = keysFor("alice");
    auto bob = keysFor("bob");
    Transaction tx;
    tx.addInput(ledger::crypto::sha256(std::string("prev")), 0);
    tx.addInput(ledger::crypto::sha256(std::string("prev")), 1);
    tx.addOutput(4.0, bob.publicKey);
    tx.addOutput(5.0, alice.publicKey);
    for (size_t i = 0; i < tx.numInputs(); ++i) {
        assert(tx.addSignature(ledger::crypto::signMessage(tx.getRawDataToSign(i), alice.privateKey), i));
    }
    tx.finalize();
    return tx;
}

static void testRawDataToSign() {
    Transaction tx = sampleTx();
    auto p0 = tx.getRawDataToSign(0);
    auto p1 = tx.getRawDataToSign(1);
    assert(!p0.empty());
    assert(p0 != p1);
    assert(p0.size() == 32 + 4 + 2 * (8 + 33));
    assert(tx.getRawDataToSign(2).empty());

    // Signatures are not part of the signed payload, outputs are.
    Transaction copy = tx;
    copy.addSignature(ledger::crypto::Signature{}, 0);
    assert(copy.getRawDataToSign(0) == p0);
    copy.addOutput(1.0, keysFor("carol").publicKey);
    assert(copy.getRawDataToSign(0) != p0);
}

static void testFinalizeHash() {
    Transaction tx = sampleTx();
    assert(tx.hasHash());
    assert(tx.getHash() == ledger::crypto::sha256(tx.getRawTx()));

    Transaction other = sampleTx();
    assert(other.getHash() == tx.getHash());

    Transaction unsealed;
    assert(!unsealed.hasHash());

    other.addSignature(ledger::crypto::Signature{}, 1);
    other.finalize();
    assert(other.getHash() != tx.getHash());
    assert(tx.totalOutput() == 9.0);
}

static void testBuilderEdits() {
    Transaction tx = sampleTx();
    UTXO second(ledger::crypto::sha256(std::string("prev")), 1);
    assert(!tx.addSignature(ledger::crypto::Signature{}, 5));
    assert(tx.removeInput(second));
    assert(!tx.removeInput(second));
    assert(tx.numInputs() == 1);
    assert(tx.getInput(0).outputIndex == 0);
    assert(!tx.removeInput(3));
    assert(tx.removeInput(static_cast<size_t>(0)));
    assert(tx.numInputs() == 0);
}

static void testSerializeRoundTrip() {
    Transaction tx = sampleTx();
    Transaction decoded = Transaction::deserialize(tx.serialize());
    assert(decoded.getHash() == tx.getHash());
    assert(decoded.numInputs() == 2);
    assert(decoded.numOutputs() == 2);
    assert(decoded.getInput(1).signature == tx.getInput(1).signature);
    assert(decoded.getOutput(0) == tx.getOutput(0));
    assert(decoded.getRawTx() == tx.getRawTx());
}

static void testMalformedDeserializationRejected() {
    std::vector<uint8_t> bytes = sampleTx().serialize();

    std::vector<uint8_t> truncated(bytes.begin(), bytes.end() - 1);
    assert(!Transaction::deserialize(truncated).hasHash());

    std::vector<uint8_t> trailing = bytes;
    trailing.push_back(0);
    assert(!Transaction::deserialize(trailing).hasHash());

    std::vector<uint8_t> hugeCount = bytes;
    hugeCount[32] = 0xff;
    hugeCount[33] = 0xff;
    assert(!Transaction::deserialize(hugeCount).hasHash());

    assert(!Transaction::deserialize({}).hasHash());
}

int main() {
    testRawDataToSign();
    testFinalizeHash();
    testBuilderEdits();
    testSerializeRoundTrip();
    testMalformedDeserializationRejected();
    return 0;
}
