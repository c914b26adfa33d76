#ifndef QKDSIM_CLASSICAL_CHANNEL_H
#define QKDSIM_CLASSICAL_CHANNEL_H

#include "crypto/crypto.h"
#include "infrastructure/error_handling.h"
#include <functional>
#include <string>
#include <vector>

namespace qkdsim {
namespace quantum {

enum class Party {
    ALICE,
    BOB
};

const char* partyToString(Party party);

// Batched disclosures carry one record per round: the value byte followed by
// a truncated HMAC-SHA-256 tag over that round alone.
constexpr size_t ROUND_TAG_SIZE = 16;
constexpr size_t ROUND_RECORD_SIZE = 1 + ROUND_TAG_SIZE;

struct Disclosure {
    Party from = Party::ALICE;
    uint64_t sequence = 0;
    std::string topic;
    std::vector<uint8_t> payload;
    crypto::Signature signature{};
};

/**
 * Public, authenticated, unencrypted channel between the two parties.
 *
 * Every disclosure is signed by its sender with a secp256k1 key derived
 * from the run seed, so a seeded run signs identically every time. The
 * receiving party verifies before acting on a message.
 */
class ClassicalChannel {
public:
    using Tamper = std::function<void(Disclosure&)>;

    explicit ClassicalChannel(uint64_t sessionSeed);

    Disclosure publish(Party from, const std::string& topic, std::vector<uint8_t> payload);

    // Fails with AUTHENTICATION_FAILED if the signature does not match.
    Result<void> verify(const Disclosure& message) const;

    // One signed message holding a tagged record per round. The value of
    // round i is payload[i * ROUND_RECORD_SIZE].
    Disclosure publishRounds(Party from, const std::string& topic, const std::vector<uint8_t>& values);

    // Returns which rounds the receiver may trust. A valid signature accepts
    // every round; otherwise each round stands on its own tag, so tampering
    // with some rounds does not discard the rest.
    std::vector<bool> verifyRounds(const Disclosure& message, size_t rounds) const;

    // Installs a hook that may alter messages after signing, modelling an
    // active man-in-the-middle on the classical link.
    void setTamper(Tamper tamper) { tamper_ = std::move(tamper); }

    const crypto::PublicKey& publicKey(Party party) const;
    size_t messageCount() const { return sequence_; }
    size_t rejectedCount() const { return rejected_; }

private:
    crypto::Hash256 digest(const Disclosure& message) const;
    std::vector<uint8_t> roundTag(const Disclosure& message, uint64_t round, uint8_t value) const;

    crypto::KeyPair alice_;
    crypto::KeyPair bob_;
    std::vector<uint8_t> aliceMac_;
    std::vector<uint8_t> bobMac_;
    uint64_t sequence_ = 0;
    mutable size_t rejected_ = 0;
    Tamper tamper_;
};

}
}

#endif
