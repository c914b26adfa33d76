#include "quantum/reconciliation.h"
#include "crypto/crypto.h"
#include <algorithm>
#include <cmath>

namespace qkdsim {
namespace quantum {

static bool keepForKey(Protocol protocol, const ChannelEvent& ev) {
    if (ev.lost) return false;
    switch (protocol) {
        case Protocol::TELEPORTATION:
            return ev.correctionAuthenticated && ev.senderBasis == ev.receiverBasis;
        case Protocol::BB84:
        case Protocol::E91:
        case Protocol::BBM92:
        default:
            return ev.senderBasis == ev.receiverBasis;
    }
}

SiftedKey sift(const Transcript& transcript) {
    SiftedKey out;
    for (const auto& ev : transcript.events) {
        if (!keepForKey(transcript.protocol, ev)) {
            out.discarded++;
            continue;
        }
        out.senderBits.push_back(ev.senderBit);
        out.receiverBits.push_back(ev.receiverBit);
        out.positions.push_back(ev.index);
    }
    return out;
}

Result<ErrorEstimate> estimateError(const SiftedKey& sifted, double disclosedSampleFraction,
                                    RandomSource& rng, size_t minSiftedBits) {
    if (!(disclosedSampleFraction > 0.0 && disclosedSampleFraction < 1.0)) {
        return makeError(ErrorCode::INVALID_PROTOCOL_PARAMETERS,
                         "disclosed sample fraction must lie in (0,1)");
    }
    size_t n = sifted.size();
    if (n == 0 || n < minSiftedBits) {
        return makeError(ErrorCode::INSUFFICIENT_SIFTED_BITS,
                         "sifting kept " + std::to_string(n) + " bits, need at least " +
                         std::to_string(std::max<size_t>(minSiftedBits, 1)));
    }

    size_t k = static_cast<size_t>(std::ceil(disclosedSampleFraction * static_cast<double>(n)));
    k = std::min(std::max<size_t>(k, 1), n);

    ErrorEstimate est;
    est.disclosedIndices = rng.sampleIndices(n, k);
    est.sampleSize = k;
    for (size_t idx : est.disclosedIndices) {
        if (sifted.senderBits[idx] != sifted.receiverBits[idx]) est.mismatches++;
    }
    est.qber = static_cast<double>(est.mismatches) / static_cast<double>(k);
    return est;
}

std::vector<uint8_t> finalizeKey(const std::vector<uint8_t>& siftedBits,
                                 const std::vector<size_t>& disclosedIndices) {
    std::vector<bool> drop(siftedBits.size(), false);
    for (size_t idx : disclosedIndices) {
        if (idx < drop.size()) drop[idx] = true;
    }
    std::vector<uint8_t> key;
    key.reserve(siftedBits.size());
    for (size_t i = 0; i < siftedBits.size(); ++i) {
        if (!drop[i]) key.push_back(siftedBits[i]);
    }
    return key;
}

static int chshSetting(const ChannelEvent& ev) {
    int a = ev.senderBasis == Basis::RECTILINEAR ? 0 : ev.senderBasis == Basis::DIAGONAL ? 1 : -1;
    int b = ev.receiverBasis == Basis::ANGLE_22_5 ? 0 : ev.receiverBasis == Basis::ANGLE_67_5 ? 1 : -1;
    if (a < 0 || b < 0) return -1;
    return a * 2 + b;
}

BellTest chshParameter(const Transcript& transcript) {
    BellTest bt;
    long long agree[4] = {0, 0, 0, 0};
    for (const auto& ev : transcript.events) {
        if (ev.lost) continue;
        int setting = chshSetting(ev);
        if (setting < 0) continue;
        bt.samples[setting]++;
        agree[setting] += ev.senderBit == ev.receiverBit ? 1 : -1;
    }

    bt.complete = true;
    for (int i = 0; i < 4; ++i) {
        if (bt.samples[i] == 0) {
            bt.complete = false;
            continue;
        }
        bt.correlation[i] = static_cast<double>(agree[i]) / static_cast<double>(bt.samples[i]);
    }
    // S = E(0,22.5) - E(0,67.5) + E(45,22.5) + E(45,67.5)
    bt.s = bt.correlation[0] - bt.correlation[1] + bt.correlation[2] + bt.correlation[3];
    return bt;
}

const char* securityLevel(double qber) {
    if (qber < SECURITY_HIGH_QBER) return "High";
    if (qber < SECURITY_MEDIUM_QBER) return "Medium";
    return "Low";
}

double agreementRate(const SiftedKey& sifted) {
    if (sifted.size() == 0) return 0.0;
    size_t same = 0;
    for (size_t i = 0; i < sifted.size(); ++i) {
        if (sifted.senderBits[i] == sifted.receiverBits[i]) same++;
    }
    return static_cast<double>(same) / static_cast<double>(sifted.size());
}

std::vector<uint8_t> packBits(const std::vector<uint8_t>& bits) {
    std::vector<uint8_t> out((bits.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i]) out[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
    }
    return out;
}

std::string privacyAmplify(const std::vector<uint8_t>& finalKey) {
    std::vector<uint8_t> packed = packBits(finalKey);
    std::string hex = crypto::sha256Hex(packed);
    crypto::secureZero(packed.data(), packed.size());
    return hex;
}

std::string bitsToString(const std::vector<uint8_t>& bits) {
    std::string s;
    s.reserve(bits.size());
    for (uint8_t b : bits) s += b ? '1' : '0';
    return s;
}

}
}
