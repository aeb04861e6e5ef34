#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <cstddef>

namespace ledger {
namespace crypto {

constexpr size_t SHA256_SIZE = 32;
constexpr size_t PRIVATE_KEY_SIZE = 32;
constexpr size_t PUBLIC_KEY_SIZE = 33;
constexpr size_t SIGNATURE_SIZE = 64;

using Hash256 = std::array<uint8_t, SHA256_SIZE>;
using PrivateKey = std::array<uint8_t, PRIVATE_KEY_SIZE>;
using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

struct KeyPair {
    PublicKey publicKey;
    PrivateKey privateKey;
};

class Sha256 {
public:
    Sha256();
    Sha256& write(const uint8_t* data, size_t len);
    Sha256& write(const std::vector<uint8_t>& data);
    Hash256 finalize();
    void reset();

private:
    void transform(const uint8_t block[64]);

    uint32_t state_[8];
    uint8_t buf_[64];
    size_t bufLen_;
    uint64_t total_;
};

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const std::vector<uint8_t>& data);
Hash256 sha256(const std::string& data);
Hash256 doubleSha256(const uint8_t* data, size_t len);
Hash256 doubleSha256(const std::vector<uint8_t>& data);

KeyPair generateKeyPair();
KeyPair keyPairFromSeed(const Hash256& seed);
PublicKey derivePublicKey(const PrivateKey& privateKey);

// Both return an all-zero signature / false on any secp256k1 failure.
Signature sign(const Hash256& hash, const PrivateKey& privateKey);
bool verify(const Hash256& hash, const Signature& signature, const PublicKey& publicKey);

Signature signMessage(const std::vector<uint8_t>& message, const PrivateKey& privateKey);
bool verifyMessage(const PublicKey& publicKey, const std::vector<uint8_t>& message, const Signature& signature);

std::string toHex(const uint8_t* data, size_t len);
std::string toHex(const std::vector<uint8_t>& data);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}
std::vector<uint8_t> fromHex(const std::string& hex);

template<size_t N>
bool isNull(const std::array<uint8_t, N>& data) {
    for (uint8_t b : data) {
        if (b != 0) return false;
    }
    return true;
}

// Capability used by the transaction handler to authorize spends.
class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;
    virtual bool verify(const PublicKey& owner,
                        const std::vector<uint8_t>& payload,
                        const Signature& authorization) const = 0;
};

class Secp256k1Verifier : public SignatureVerifier {
public:
    bool verify(const PublicKey& owner,
                const std::vector<uint8_t>& payload,
                const Signature& authorization) const override;

    static const Secp256k1Verifier& instance();
};

}
}
