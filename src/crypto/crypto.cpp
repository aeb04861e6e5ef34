#include "crypto/crypto.h"
#include <secp256k1.h>
#include <algorithm>
#include <cstring>
#include <random>
#include <mutex>

namespace ledger {
namespace crypto {

static inline uint32_t rotr32(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }
static inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (~x & z); }
static inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (x & z) ^ (y & z); }
static inline uint32_t sig0(uint32_t x) { return rotr32(x, 2) ^ rotr32(x, 13) ^ rotr32(x, 22); }
static inline uint32_t sig1(uint32_t x) { return rotr32(x, 6) ^ rotr32(x, 11) ^ rotr32(x, 25); }
static inline uint32_t ep0(uint32_t x) { return rotr32(x, 7) ^ rotr32(x, 18) ^ (x >> 3); }
static inline uint32_t ep1(uint32_t x) { return rotr32(x, 17) ^ rotr32(x, 19) ^ (x >> 10); }

static const uint32_t K256[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

static secp256k1_context* secpContext() {
    static secp256k1_context* ctx = [] {
        return secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    }();
    return ctx;
}

Sha256::Sha256() {
    reset();
}

void Sha256::reset() {
    static const uint32_t init[8] = {
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
    };
    std::memcpy(state_, init, sizeof(state_));
    bufLen_ = 0;
    total_ = 0;
}

void Sha256::transform(const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(block[i*4]) << 24) | (static_cast<uint32_t>(block[i*4+1]) << 16) |
               (static_cast<uint32_t>(block[i*4+2]) << 8) | block[i*4+3];
    }
    for (int i = 16; i < 64; i++) {
        w[i] = ep1(w[i-2]) + w[i-7] + ep0(w[i-15]) + w[i-16];
    }

    uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3];
    uint32_t e = state_[4], f = state_[5], g = state_[6], h = state_[7];

    for (int i = 0; i < 64; i++) {
        uint32_t t1 = h + sig1(e) + ch(e, f, g) + K256[i] + w[i];
        uint32_t t2 = sig0(a) + maj(a, b, c);
        h = g; g = f; f = e; e = d + t1;
        d = c; c = b; b = a; a = t1 + t2;
    }

    state_[0] += a; state_[1] += b; state_[2] += c; state_[3] += d;
    state_[4] += e; state_[5] += f; state_[6] += g; state_[7] += h;
}

Sha256& Sha256::write(const uint8_t* data, size_t len) {
    total_ += len;
    while (len > 0) {
        size_t take = std::min(len, sizeof(buf_) - bufLen_);
        std::memcpy(buf_ + bufLen_, data, take);
        bufLen_ += take;
        data += take;
        len -= take;
        if (bufLen_ == sizeof(buf_)) {
            transform(buf_);
            bufLen_ = 0;
        }
    }
    return *this;
}

Sha256& Sha256::write(const std::vector<uint8_t>& data) {
    return write(data.data(), data.size());
}

Hash256 Sha256::finalize() {
    uint64_t bits = total_ * 8;
    uint8_t pad = 0x80;
    write(&pad, 1);
    uint8_t zero = 0;
    while (bufLen_ != 56) write(&zero, 1);
    uint8_t lenBytes[8];
    for (int j = 0; j < 8; j++) {
        lenBytes[j] = static_cast<uint8_t>((bits >> (56 - j * 8)) & 0xff);
    }
    write(lenBytes, 8);

    Hash256 hash;
    for (int j = 0; j < 8; j++) {
        hash[j*4] = (state_[j] >> 24) & 0xff;
        hash[j*4+1] = (state_[j] >> 16) & 0xff;
        hash[j*4+2] = (state_[j] >> 8) & 0xff;
        hash[j*4+3] = state_[j] & 0xff;
    }
    reset();
    return hash;
}

Hash256 sha256(const uint8_t* data, size_t len) {
    return Sha256().write(data, len).finalize();
}

Hash256 sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Hash256 sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash256 doubleSha256(const uint8_t* data, size_t len) {
    Hash256 first = sha256(data, len);
    return sha256(first.data(), first.size());
}

Hash256 doubleSha256(const std::vector<uint8_t>& data) {
    return doubleSha256(data.data(), data.size());
}

KeyPair generateKeyPair() {
    static std::mutex mtx;
    std::lock_guard<std::mutex> lock(mtx);

    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    KeyPair kp;
    for (;;) {
        for (size_t i = 0; i < PRIVATE_KEY_SIZE; i += 8) {
            uint64_t val = dis(gen);
            for (size_t j = 0; j < 8 && i + j < PRIVATE_KEY_SIZE; j++) {
                kp.privateKey[i + j] = (val >> (j * 8)) & 0xff;
            }
        }
        if (secp256k1_ec_seckey_verify(secpContext(), kp.privateKey.data())) break;
    }
    kp.publicKey = derivePublicKey(kp.privateKey);
    return kp;
}

KeyPair keyPairFromSeed(const Hash256& seed) {
    KeyPair kp;
    Hash256 cur = seed;
    for (int i = 0; i < 1000; ++i) {
        std::memcpy(kp.privateKey.data(), cur.data(), PRIVATE_KEY_SIZE);
        if (secp256k1_ec_seckey_verify(secpContext(), kp.privateKey.data())) break;
        cur = sha256(cur.data(), cur.size());
    }
    kp.publicKey = derivePublicKey(kp.privateKey);
    return kp;
}

PublicKey derivePublicKey(const PrivateKey& privateKey) {
    PublicKey out{};
    secp256k1_pubkey pub{};
    if (!secp256k1_ec_pubkey_create(secpContext(), &pub, privateKey.data())) {
        out.fill(0);
        return out;
    }
    size_t outLen = out.size();
    if (!secp256k1_ec_pubkey_serialize(secpContext(), out.data(), &outLen, &pub, SECP256K1_EC_COMPRESSED) ||
        outLen != out.size()) {
        out.fill(0);
    }
    return out;
}

Signature sign(const Hash256& hash, const PrivateKey& privateKey) {
    Signature out{};
    secp256k1_context* ctx = secpContext();
    if (!secp256k1_ec_seckey_verify(ctx, privateKey.data())) return out;

    secp256k1_ecdsa_signature sig{};
    if (!secp256k1_ecdsa_sign(ctx, &sig, hash.data(), privateKey.data(), secp256k1_nonce_function_rfc6979, nullptr)) {
        return out;
    }
    secp256k1_ecdsa_signature_normalize(ctx, &sig, &sig);
    if (!secp256k1_ecdsa_signature_serialize_compact(ctx, out.data(), &sig)) {
        out.fill(0);
    }
    return out;
}

bool verify(const Hash256& hash, const Signature& signature, const PublicKey& publicKey) {
    secp256k1_context* ctx = secpContext();
    secp256k1_pubkey pub{};
    if (!secp256k1_ec_pubkey_parse(ctx, &pub, publicKey.data(), publicKey.size())) return false;
    secp256k1_ecdsa_signature sig{};
    if (!secp256k1_ecdsa_signature_parse_compact(ctx, &sig, signature.data())) return false;
    secp256k1_ecdsa_signature_normalize(ctx, &sig, &sig);
    return secp256k1_ecdsa_verify(ctx, &sig, hash.data(), &pub) == 1;
}

Signature signMessage(const std::vector<uint8_t>& message, const PrivateKey& privateKey) {
    return sign(sha256(message), privateKey);
}

bool verifyMessage(const PublicKey& publicKey, const std::vector<uint8_t>& message, const Signature& signature) {
    if (isNull(publicKey) || isNull(signature)) return false;
    return verify(sha256(message), signature, publicKey);
}

std::string toHex(const uint8_t* data, size_t len) {
    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result += hex[data[i] >> 4];
        result += hex[data[i] & 0x0f];
    }
    return result;
}

std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

static int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::vector<uint8_t> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) return {};
    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexNibble(hex[i]);
        int lo = hexNibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return {};
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

bool Secp256k1Verifier::verify(const PublicKey& owner,
                               const std::vector<uint8_t>& payload,
                               const Signature& authorization) const {
    if (payload.empty()) return false;
    return verifyMessage(owner, payload, authorization);
}

const Secp256k1Verifier& Secp256k1Verifier::instance() {
    static const Secp256k1Verifier verifier{};
    return verifier;
}

}
}
