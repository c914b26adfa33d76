#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace qkdsim {
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

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const std::vector<uint8_t>& data);
Hash256 sha256(const std::string& data);
std::string sha256Hex(const std::vector<uint8_t>& data);

std::vector<uint8_t> hmacSha256(const std::vector<uint8_t>& key, const std::vector<uint8_t>& data);

// Deterministic: the same seed always yields the same key pair. An
// all-zero public key means the seed could not be turned into a valid
// secp256k1 scalar.
KeyPair keyPairFromSeed(const Hash256& seed);
PublicKey derivePublicKey(const PrivateKey& privateKey);

// ECDSA over secp256k1 with RFC 6979 nonces. A failed signing returns an
// all-zero signature, which never verifies.
Signature sign(const Hash256& hash, const PrivateKey& privateKey);
bool verify(const Hash256& hash, const Signature& signature, const PublicKey& publicKey);

void secureZero(void* ptr, size_t len);

std::string toHex(const uint8_t* data, size_t len);
std::string toHex(const std::vector<uint8_t>& data);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}

}
}
