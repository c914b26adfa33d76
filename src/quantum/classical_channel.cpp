#include "quantum/classical_channel.h"
#include "utils/logger.h"
#include <algorithm>

namespace qkdsim {
namespace quantum {

const char* partyToString(Party party) {
    return party == Party::ALICE ? "alice" : "bob";
}

static void appendU64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 7; i >= 0; --i) out.push_back(static_cast<uint8_t>(v >> (i * 8)));
}

static std::vector<uint8_t> deriveSecret(uint64_t sessionSeed, const std::string& label) {
    std::vector<uint8_t> seedBytes;
    appendU64(seedBytes, sessionSeed);
    return crypto::hmacSha256(seedBytes, std::vector<uint8_t>(label.begin(), label.end()));
}

static crypto::KeyPair partyKey(uint64_t sessionSeed, Party party) {
    std::vector<uint8_t> mac = deriveSecret(sessionSeed, std::string("qkdsim-classical-") + partyToString(party));
    crypto::Hash256 material;
    std::copy(mac.begin(), mac.end(), material.begin());
    crypto::KeyPair kp = crypto::keyPairFromSeed(material);
    crypto::secureZero(material.data(), material.size());
    crypto::secureZero(mac.data(), mac.size());
    return kp;
}

ClassicalChannel::ClassicalChannel(uint64_t sessionSeed)
    : alice_(partyKey(sessionSeed, Party::ALICE)),
      bob_(partyKey(sessionSeed, Party::BOB)),
      aliceMac_(deriveSecret(sessionSeed, "qkdsim-round-mac-alice")),
      bobMac_(deriveSecret(sessionSeed, "qkdsim-round-mac-bob")) {}

const crypto::PublicKey& ClassicalChannel::publicKey(Party party) const {
    return party == Party::ALICE ? alice_.publicKey : bob_.publicKey;
}

crypto::Hash256 ClassicalChannel::digest(const Disclosure& message) const {
    std::vector<uint8_t> buf;
    buf.reserve(16 + message.topic.size() + message.payload.size());
    buf.push_back(static_cast<uint8_t>(message.from));
    appendU64(buf, message.sequence);
    buf.insert(buf.end(), message.topic.begin(), message.topic.end());
    buf.push_back(0);
    buf.insert(buf.end(), message.payload.begin(), message.payload.end());
    return crypto::sha256(buf);
}

Disclosure ClassicalChannel::publish(Party from, const std::string& topic, std::vector<uint8_t> payload) {
    Disclosure msg;
    msg.from = from;
    msg.sequence = sequence_++;
    msg.topic = topic;
    msg.payload = std::move(payload);
    const crypto::KeyPair& kp = from == Party::ALICE ? alice_ : bob_;
    msg.signature = crypto::sign(digest(msg), kp.privateKey);
    if (tamper_) tamper_(msg);
    return msg;
}

Result<void> ClassicalChannel::verify(const Disclosure& message) const {
    if (!crypto::verify(digest(message), message.signature, publicKey(message.from))) {
        rejected_++;
        LOG_CAT(utils::LogLevel::WARN, "classical",
                "signature check failed for " + message.topic + " #" + std::to_string(message.sequence) +
                " from " + partyToString(message.from));
        return makeError(ErrorCode::AUTHENTICATION_FAILED,
                         "classical message '" + message.topic + "' failed authentication");
    }
    return {};
}

std::vector<uint8_t> ClassicalChannel::roundTag(const Disclosure& message, uint64_t round,
                                                uint8_t value) const {
    std::vector<uint8_t> buf(message.topic.begin(), message.topic.end());
    buf.push_back(0);
    appendU64(buf, message.sequence);
    appendU64(buf, round);
    buf.push_back(value);
    std::vector<uint8_t> tag = crypto::hmacSha256(message.from == Party::ALICE ? aliceMac_ : bobMac_, buf);
    tag.resize(ROUND_TAG_SIZE);
    return tag;
}

Disclosure ClassicalChannel::publishRounds(Party from, const std::string& topic,
                                           const std::vector<uint8_t>& values) {
    Disclosure msg;
    msg.from = from;
    msg.sequence = sequence_++;
    msg.topic = topic;
    msg.payload.reserve(values.size() * ROUND_RECORD_SIZE);
    for (size_t i = 0; i < values.size(); i++) {
        msg.payload.push_back(values[i]);
        std::vector<uint8_t> tag = roundTag(msg, i, values[i]);
        msg.payload.insert(msg.payload.end(), tag.begin(), tag.end());
    }
    const crypto::KeyPair& kp = from == Party::ALICE ? alice_ : bob_;
    msg.signature = crypto::sign(digest(msg), kp.privateKey);
    if (tamper_) tamper_(msg);
    return msg;
}

std::vector<bool> ClassicalChannel::verifyRounds(const Disclosure& message, size_t rounds) const {
    std::vector<bool> trusted(rounds, false);
    bool sized = message.payload.size() == rounds * ROUND_RECORD_SIZE;
    if (sized && crypto::verify(digest(message), message.signature, publicKey(message.from))) {
        trusted.assign(rounds, true);
        return trusted;
    }

    rejected_++;
    size_t accepted = 0;
    size_t available = std::min(rounds, message.payload.size() / ROUND_RECORD_SIZE);
    for (size_t i = 0; i < available; i++) {
        auto record = message.payload.begin() + static_cast<std::ptrdiff_t>(i * ROUND_RECORD_SIZE);
        std::vector<uint8_t> expected = roundTag(message, i, *record);
        trusted[i] = std::equal(expected.begin(), expected.end(), record + 1);
        if (trusted[i]) accepted++;
    }
    LOG_CAT(utils::LogLevel::WARN, "classical",
            "signature check failed for " + message.topic + " #" + std::to_string(message.sequence) +
            " from " + partyToString(message.from) + ", " + std::to_string(accepted) + "/" +
            std::to_string(rounds) + " rounds still authenticated");
    return trusted;
}

}
}
