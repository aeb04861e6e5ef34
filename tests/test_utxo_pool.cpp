#include "core/utxo_pool.h"
#include "crypto/crypto.h"
#include <cassert>
#include <string>
#include <unordered_set>

using ledger::core::TxOutput;
using ledger::core::UTXO;
using ledger::core::UTXOHasher;
using ledger::core::UTXOPool;

static ledger::crypto::PublicKey keyFor(const std::string& name) {
    return ledger::crypto::keyPairFromSeed(ledger::crypto::sha256(name)).publicKey;
}

static void testUtxoIdentity() {
    auto h1 = ledger::crypto::sha256(std::string("tx1"));
    auto h2 = ledger::crypto::sha256(std::string("tx2"));

    assert(UTXO(h1, 0) == UTXO(h1, 0));
    assert(UTXO(h1, 0) != UTXO(h1, 1));
    assert(UTXO(h1, 0) != UTXO(h2, 0));
    assert(UTXOHasher{}(UTXO(h1, 3)) == UTXOHasher{}(UTXO(h1, 3)));

    std::unordered_set<UTXO, UTXOHasher> set;
    set.insert(UTXO(h1, 0));
    set.insert(UTXO(h1, 0));
    set.insert(UTXO(h1, 1));
    set.insert(UTXO(h2, 0));
    assert(set.size() == 3);

    assert(UTXO(h1, 0) < UTXO(h1, 1));
    assert(UTXO(h1, 7).toString() == ledger::crypto::toHex(h1) + ":7");
}

static void testInsertLookupRemove() {
    UTXOPool pool;
    auto h = ledger::crypto::sha256(std::string("origin"));
    UTXO a(h, 0);
    UTXO b(h, 1);
    auto owner = keyFor("alice");

    assert(pool.empty());
    assert(!pool.contains(a));
    assert(!pool.getTxOutput(a).has_value());

    pool.addUTXO(a, TxOutput(10.0, owner));
    assert(pool.contains(a));
    assert(!pool.contains(b));
    assert(pool.getTxOutput(a)->value == 10.0);
    assert(pool.getTxOutput(a)->address == owner);

    pool.addUTXO(a, TxOutput(7.5, owner));
    assert(pool.size() == 1);
    assert(pool.getTxOutput(a)->value == 7.5);

    pool.addUTXO(b, TxOutput(2.5, owner));
    assert(pool.totalValue() == 10.0);

    assert(pool.removeUTXO(a));
    assert(!pool.contains(a));
    assert(!pool.removeUTXO(a));
    assert(pool.size() == 1);
}

static void testCopyIsIndependent() {
    UTXOPool original;
    auto h = ledger::crypto::sha256(std::string("snapshot"));
    auto owner = keyFor("bob");
    original.addUTXO(UTXO(h, 0), TxOutput(1.0, owner));
    original.addUTXO(UTXO(h, 1), TxOutput(2.0, owner));

    UTXOPool copy(original);
    original.removeUTXO(UTXO(h, 0));
    original.addUTXO(UTXO(h, 2), TxOutput(3.0, owner));

    assert(copy.size() == 2);
    assert(copy.contains(UTXO(h, 0)));
    assert(!copy.contains(UTXO(h, 2)));

    UTXOPool assigned;
    assigned = copy;
    copy.clear();
    assert(assigned.size() == 2);
    assert(copy.empty());
}

static void testGetAllUtxoSorted() {
    UTXOPool pool;
    auto owner = keyFor("carol");
    auto h1 = ledger::crypto::sha256(std::string("x"));
    auto h2 = ledger::crypto::sha256(std::string("y"));
    pool.addUTXO(UTXO(h2, 1), TxOutput(1.0, owner));
    pool.addUTXO(UTXO(h1, 4), TxOutput(1.0, owner));
    pool.addUTXO(UTXO(h2, 0), TxOutput(1.0, owner));
    pool.addUTXO(UTXO(h1, 2), TxOutput(1.0, owner));

    auto all = pool.getAllUTXO();
    assert(all.size() == 4);
    for (size_t i = 1; i < all.size(); ++i) {
        assert(all[i - 1] < all[i]);
    }
}

int main() {
    testUtxoIdentity();
    testInsertLookupRemove();
    testCopyIsIndependent();
    testGetAllUtxoSorted();
    return 0;
}
