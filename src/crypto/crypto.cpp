#include "crypto/crypto.h"
#include <secp256k1.h>
#include <cstring>
#include <mutex>

namespace qkdsim {
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

static void sha256Block(uint32_t state[8], const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) | (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i * 4 + 2]) << 8) | block[i * 4 + 3];
    }
    for (int i = 16; i < 64; i++) {
        w[i] = ep1(w[i - 2]) + w[i - 7] + ep0(w[i - 15]) + w[i - 16];
    }

    uint32_t v[8];
    std::memcpy(v, state, sizeof(v));
    for (int i = 0; i < 64; i++) {
        uint32_t t1 = v[7] + sig1(v[4]) + ch(v[4], v[5], v[6]) + K256[i] + w[i];
        uint32_t t2 = sig0(v[0]) + maj(v[0], v[1], v[2]);
        std::memmove(v + 1, v, 7 * sizeof(uint32_t));
        v[4] += t1;
        v[0] = t1 + t2;
    }
    for (int i = 0; i < 8; i++) state[i] += v[i];
}

Hash256 sha256(const uint8_t* data, size_t len) {
    uint32_t state[8] = {
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
    };

    size_t off = 0;
    for (; off + 64 <= len; off += 64) sha256Block(state, data + off);

    uint8_t tail[128] = {0};
    size_t rem = len - off;
    if (rem) std::memcpy(tail, data + off, rem);
    tail[rem] = 0x80;
    size_t tailLen = rem + 1 + 8 <= 64 ? 64 : 128;
    uint64_t bits = static_cast<uint64_t>(len) * 8;
    for (int j = 0; j < 8; j++) {
        tail[tailLen - 1 - j] = static_cast<uint8_t>(bits >> (j * 8));
    }
    sha256Block(state, tail);
    if (tailLen == 128) sha256Block(state, tail + 64);

    Hash256 hash;
    for (int j = 0; j < 8; j++) {
        hash[j * 4] = (state[j] >> 24) & 0xff;
        hash[j * 4 + 1] = (state[j] >> 16) & 0xff;
        hash[j * 4 + 2] = (state[j] >> 8) & 0xff;
        hash[j * 4 + 3] = state[j] & 0xff;
    }
    return hash;
}

Hash256 sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Hash256 sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string sha256Hex(const std::vector<uint8_t>& data) {
    return toHex(sha256(data));
}

std::vector<uint8_t> hmacSha256(const std::vector<uint8_t>& key, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> keyPad = key;
    if (keyPad.size() > 64) {
        Hash256 h = sha256(keyPad);
        keyPad.assign(h.begin(), h.end());
    }
    keyPad.resize(64, 0);

    std::vector<uint8_t> inner(64), outer(64);
    for (size_t i = 0; i < 64; i++) {
        inner[i] = keyPad[i] ^ 0x36;
        outer[i] = keyPad[i] ^ 0x5c;
    }
    inner.insert(inner.end(), data.begin(), data.end());
    Hash256 innerHash = sha256(inner);
    outer.insert(outer.end(), innerHash.begin(), innerHash.end());
    Hash256 result = sha256(outer);
    secureZero(keyPad.data(), keyPad.size());
    return std::vector<uint8_t>(result.begin(), result.end());
}

// secp256k1 contexts are safe for concurrent use once created; creation
// and randomization are not.
static secp256k1_context* context() {
    static std::once_flag once;
    static secp256k1_context* ctx = nullptr;
    std::call_once(once, [] {
        ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    });
    return ctx;
}

KeyPair keyPairFromSeed(const Hash256& seed) {
    KeyPair kp{};
    Hash256 cur = seed;
    bool valid = false;
    for (int i = 0; i < 1000 && !valid; ++i) {
        std::memcpy(kp.privateKey.data(), cur.data(), PRIVATE_KEY_SIZE);
        valid = secp256k1_ec_seckey_verify(context(), kp.privateKey.data()) == 1;
        if (!valid) cur = sha256(cur.data(), cur.size());
    }
    if (!valid) {
        kp.privateKey.fill(0);
        kp.publicKey.fill(0);
        return kp;
    }
    kp.publicKey = derivePublicKey(kp.privateKey);
    return kp;
}

PublicKey derivePublicKey(const PrivateKey& privateKey) {
    PublicKey out{};
    secp256k1_pubkey pub{};
    if (!secp256k1_ec_pubkey_create(context(), &pub, privateKey.data())) {
        out.fill(0);
        return out;
    }
    size_t outLen = out.size();
    if (!secp256k1_ec_pubkey_serialize(context(), out.data(), &outLen, &pub, SECP256K1_EC_COMPRESSED) ||
        outLen != out.size()) {
        out.fill(0);
    }
    return out;
}

Signature sign(const Hash256& hash, const PrivateKey& privateKey) {
    Signature out{};
    if (!secp256k1_ec_seckey_verify(context(), privateKey.data())) {
        return out;
    }
    secp256k1_ecdsa_signature sig{};
    if (!secp256k1_ecdsa_sign(context(), &sig, hash.data(), privateKey.data(),
                              secp256k1_nonce_function_rfc6979, nullptr)) {
        return out;
    }
    secp256k1_ecdsa_signature_normalize(context(), &sig, &sig);
    if (!secp256k1_ecdsa_signature_serialize_compact(context(), out.data(), &sig)) {
        out.fill(0);
    }
    return out;
}

bool verify(const Hash256& hash, const Signature& signature, const PublicKey& publicKey) {
    secp256k1_pubkey pub{};
    if (!secp256k1_ec_pubkey_parse(context(), &pub, publicKey.data(), publicKey.size())) return false;
    secp256k1_ecdsa_signature sig{};
    if (!secp256k1_ecdsa_signature_parse_compact(context(), &sig, signature.data())) return false;
    secp256k1_ecdsa_signature_normalize(context(), &sig, &sig);
    return secp256k1_ecdsa_verify(context(), &sig, hash.data(), &pub) == 1;
}

void secureZero(void* ptr, size_t len) {
    volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
    while (len--) *p++ = 0;
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

}
}
