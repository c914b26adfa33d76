#include <gtest/gtest.h>
#include "quantum/reconciliation.h"
#include "quantum/result_reporter.h"
#include "crypto/crypto.h"

using namespace qkdsim;
using namespace qkdsim::quantum;

class ReconciliationTest : public ::testing::Test {
protected:
    RandomSource rng{77};

    static ChannelEvent event(size_t index, Basis a, uint8_t abit, Basis b, uint8_t bbit) {
        ChannelEvent ev;
        ev.index = index;
        ev.senderBasis = a;
        ev.senderBit = abit;
        ev.receiverBasis = b;
        ev.receiverBit = bbit;
        return ev;
    }

    static SiftedKey keyOf(const std::vector<uint8_t>& sender, const std::vector<uint8_t>& receiver) {
        SiftedKey k;
        k.senderBits = sender;
        k.receiverBits = receiver;
        for (size_t i = 0; i < sender.size(); i++) k.positions.push_back(i);
        return k;
    }
};

TEST_F(ReconciliationTest, SiftKeepsMatchingBases) {
    Transcript t;
    t.protocol = Protocol::BB84;
    t.events.push_back(event(0, Basis::RECTILINEAR, 1, Basis::RECTILINEAR, 1));
    t.events.push_back(event(1, Basis::RECTILINEAR, 0, Basis::DIAGONAL, 1));
    t.events.push_back(event(2, Basis::DIAGONAL, 0, Basis::DIAGONAL, 1));
    t.events.push_back(event(3, Basis::DIAGONAL, 1, Basis::RECTILINEAR, 1));

    SiftedKey k = sift(t);
    ASSERT_EQ(k.size(), 2u);
    EXPECT_EQ(k.positions, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(k.senderBits, (std::vector<uint8_t>{1, 0}));
    EXPECT_EQ(k.receiverBits, (std::vector<uint8_t>{1, 1}));
    EXPECT_EQ(k.discarded, 2u);
}

TEST_F(ReconciliationTest, SiftIsIdempotent) {
    Transcript t;
    t.protocol = Protocol::E91;
    for (size_t i = 0; i < 300; i++) {
        Basis a = static_cast<Basis>(rng.uniformIndex(3));
        Basis b = static_cast<Basis>(rng.uniformIndex(3) + 1);
        t.events.push_back(event(i, a, rng.nextBit(), b, rng.nextBit()));
    }
    EXPECT_EQ(sift(t), sift(t));
}

TEST_F(ReconciliationTest, SiftDropsLostUnits) {
    Transcript t;
    t.protocol = Protocol::BBM92;
    ChannelEvent lost = event(0, Basis::DIAGONAL, 1, Basis::DIAGONAL, 0);
    lost.lost = true;
    t.events.push_back(lost);
    t.events.push_back(event(1, Basis::DIAGONAL, 1, Basis::DIAGONAL, 1));

    SiftedKey k = sift(t);
    ASSERT_EQ(k.size(), 1u);
    EXPECT_EQ(k.positions[0], 1u);
    EXPECT_EQ(k.discarded, 1u);
}

TEST_F(ReconciliationTest, SiftDropsUnauthenticatedTeleportationRounds) {
    Transcript t;
    t.protocol = Protocol::TELEPORTATION;
    for (size_t i = 0; i < 4; i++) {
        ChannelEvent ev = event(i, Basis::DIAGONAL, 1, Basis::DIAGONAL, 1);
        ev.correctionAuthenticated = (i % 2) == 0;
        t.events.push_back(ev);
    }
    SiftedKey k = sift(t);
    EXPECT_EQ(k.positions, (std::vector<size_t>{0, 2}));

    t.protocol = Protocol::BB84;
    EXPECT_EQ(sift(t).size(), 4u);
}

TEST_F(ReconciliationTest, EstimateSampleSizeRoundsUp) {
    SiftedKey k = keyOf(std::vector<uint8_t>(25, 1), std::vector<uint8_t>(25, 1));
    auto est = estimateError(k, 0.1, rng);
    ASSERT_TRUE(est.ok());
    EXPECT_EQ(est.value().sampleSize, 3u);
    EXPECT_EQ(est.value().disclosedIndices.size(), 3u);
    EXPECT_DOUBLE_EQ(est.value().qber, 0.0);

    SiftedKey one = keyOf({1}, {0});
    auto single = estimateError(one, 0.1, rng);
    ASSERT_TRUE(single.ok());
    EXPECT_EQ(single.value().sampleSize, 1u);
    EXPECT_DOUBLE_EQ(single.value().qber, 1.0);
}

TEST_F(ReconciliationTest, EstimateCountsMismatches) {
    std::vector<uint8_t> a(1000, 0), b(1000, 0);
    for (size_t i = 0; i < 1000; i += 4) b[i] = 1;
    auto est = estimateError(keyOf(a, b), 0.5, rng);
    ASSERT_TRUE(est.ok());
    EXPECT_EQ(est.value().sampleSize, 500u);
    EXPECT_NEAR(est.value().qber, 0.25, 0.05);
    EXPECT_DOUBLE_EQ(est.value().qber,
                     static_cast<double>(est.value().mismatches) / est.value().sampleSize);
}

TEST_F(ReconciliationTest, EstimateRejectsEmptyAndShortKeys) {
    auto empty = estimateError(SiftedKey{}, 0.1, rng);
    ASSERT_TRUE(empty.failed());
    EXPECT_EQ(empty.error().code, ErrorCode::INSUFFICIENT_SIFTED_BITS);

    SiftedKey k = keyOf({1, 0, 1}, {1, 0, 1});
    auto shortKey = estimateError(k, 0.1, rng, 10);
    ASSERT_TRUE(shortKey.failed());
    EXPECT_EQ(shortKey.error().code, ErrorCode::INSUFFICIENT_SIFTED_BITS);
}

TEST_F(ReconciliationTest, EstimateRejectsBadFraction) {
    SiftedKey k = keyOf({1, 0}, {1, 0});
    EXPECT_EQ(estimateError(k, 0.0, rng).error().code, ErrorCode::INVALID_PROTOCOL_PARAMETERS);
    EXPECT_EQ(estimateError(k, 1.0, rng).error().code, ErrorCode::INVALID_PROTOCOL_PARAMETERS);
}

TEST_F(ReconciliationTest, FinalKeyRemovesDisclosedPositions) {
    std::vector<uint8_t> bits = {1, 0, 1, 1, 0, 0, 1};
    auto key = finalizeKey(bits, {0, 3, 6});
    EXPECT_EQ(key, (std::vector<uint8_t>{0, 1, 0, 0}));
    EXPECT_EQ(finalizeKey(bits, {}), bits);
}

TEST_F(ReconciliationTest, SecurityLevelBoundaries) {
    EXPECT_STREQ(securityLevel(0.0), "High");
    EXPECT_STREQ(securityLevel(0.049), "High");
    EXPECT_STREQ(securityLevel(0.05), "Medium");
    EXPECT_STREQ(securityLevel(0.149), "Medium");
    EXPECT_STREQ(securityLevel(0.15), "Low");
    EXPECT_STREQ(securityLevel(0.5), "Low");
}

TEST_F(ReconciliationTest, AgreementRate) {
    EXPECT_DOUBLE_EQ(agreementRate(SiftedKey{}), 0.0);
    EXPECT_DOUBLE_EQ(agreementRate(keyOf({1, 0, 1, 1}, {1, 1, 1, 0})), 0.5);
}

TEST_F(ReconciliationTest, PackBitsMostSignificantFirst) {
    EXPECT_EQ(packBits({1, 0, 0, 0, 0, 0, 0, 1, 1}), (std::vector<uint8_t>{0x81, 0x80}));
    EXPECT_TRUE(packBits({}).empty());
    EXPECT_EQ(bitsToString({1, 0, 1}), "101");
}

TEST_F(ReconciliationTest, PrivacyAmplificationHashesPackedKey) {
    std::vector<uint8_t> key = {0, 1, 1, 0, 0, 0, 0, 1};  // 0x61 == 'a'
    std::string hex = privacyAmplify(key);
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex, crypto::toHex(crypto::sha256(std::string("a"))));
    EXPECT_NE(privacyAmplify({0, 1, 1, 0, 0, 0, 1, 0}), hex);
}

TEST_F(ReconciliationTest, ChshFromIdealCorrelations) {
    Transcript t;
    t.protocol = Protocol::E91;
    // Perfect agreement except at (0, 67.5), which always disagrees.
    const Basis alice[] = {Basis::RECTILINEAR, Basis::DIAGONAL};
    const Basis bob[] = {Basis::ANGLE_22_5, Basis::ANGLE_67_5};
    size_t idx = 0;
    for (Basis a : alice) {
        for (Basis b : bob) {
            for (int i = 0; i < 10; i++) {
                uint8_t bit = static_cast<uint8_t>(i & 1);
                bool flip = a == Basis::RECTILINEAR && b == Basis::ANGLE_67_5;
                t.events.push_back(event(idx++, a, bit, b, flip ? bit ^ 1 : bit));
            }
        }
    }
    t.events.push_back(event(idx++, Basis::ANGLE_22_5, 0, Basis::ANGLE_22_5, 0));

    BellTest bt = chshParameter(t);
    EXPECT_TRUE(bt.complete);
    EXPECT_DOUBLE_EQ(bt.correlation[0], 1.0);
    EXPECT_DOUBLE_EQ(bt.correlation[1], -1.0);
    EXPECT_DOUBLE_EQ(bt.s, 4.0);
    for (size_t n : bt.samples) EXPECT_EQ(n, 10u);
}

TEST_F(ReconciliationTest, ChshIncompleteWithoutAllSettings) {
    Transcript t;
    t.protocol = Protocol::E91;
    t.events.push_back(event(0, Basis::RECTILINEAR, 0, Basis::ANGLE_22_5, 0));
    BellTest bt = chshParameter(t);
    EXPECT_FALSE(bt.complete);
    EXPECT_EQ(bt.samples[0], 1u);
}

class ResultReporterTest : public ReconciliationTest {
protected:
    ReconciliationResult reconciled(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b,
                                    std::vector<size_t> disclosed) {
        ReconciliationResult r;
        r.sifted = keyOf(a, b);
        r.estimate.disclosedIndices = std::move(disclosed);
        r.estimate.sampleSize = r.estimate.disclosedIndices.size();
        for (size_t i : r.estimate.disclosedIndices) {
            if (a[i] != b[i]) r.estimate.mismatches++;
        }
        r.estimate.qber = r.estimate.sampleSize
            ? static_cast<double>(r.estimate.mismatches) / r.estimate.sampleSize : 0.0;
        return r;
    }
};

TEST_F(ResultReporterTest, AcceptedRunCarriesAmplifiedKey) {
    ResultReporter reporter;
    EXPECT_FALSE(reporter.isFinalized());
    EXPECT_EQ(reporter.report().state, RunState::INIT);

    Transcript t;
    t.protocol = Protocol::BB84;
    for (size_t i = 0; i < 6; i++) {
        t.events.push_back(event(i, Basis::DIAGONAL, i & 1, Basis::DIAGONAL, i & 1));
    }
    SimulationConfig cfg;
    auto done = reporter.finalize(cfg, 9, t, reconciled({0, 1, 0, 1, 0, 1}, {0, 1, 0, 1, 0, 1}, {1}),
                                  {RunState::INIT, RunState::ACCEPTED});
    ASSERT_TRUE(done.ok());
    EXPECT_TRUE(reporter.isFinalized());

    const RunRecord& r = reporter.report();
    EXPECT_TRUE(r.secure);
    EXPECT_EQ(r.seed, 9u);
    EXPECT_EQ(r.finalKey, (std::vector<uint8_t>{0, 0, 1, 0, 1}));
    EXPECT_EQ(r.securityLevel, "High");
    EXPECT_DOUBLE_EQ(r.agreementRate, 1.0);
    EXPECT_EQ(r.privacyAmplifiedKey, privacyAmplify(r.finalKey));
    EXPECT_EQ(r.summary.units, 6u);
    EXPECT_EQ(r.summary.finalKeyLength, 5u);
    EXPECT_EQ(r.summary.finalKeyMismatches, 0u);

    nlohmann::json j = r.toJsonValue();
    EXPECT_EQ(j["protocol"], "BB84");
    EXPECT_EQ(j["seed"], 9u);
    EXPECT_EQ(j["final_key"], nlohmann::json({0, 0, 1, 0, 1}));
    EXPECT_EQ(j["sifted_key_length"], 5u);
    EXPECT_EQ(j["parameters"]["qubit_count"], cfg.qubitCount);
    EXPECT_FALSE(j["parameters"]["custom_bits"].get<bool>());
    EXPECT_EQ(j["privacy_amplified_key"], r.privacyAmplifiedKey);
    EXPECT_EQ(j["transcript_summary"]["units"], 6u);
    EXPECT_FALSE(j["transcript_summary"].contains("events"));
    EXPECT_FALSE(j.contains("bell_parameter"));

    nlohmann::json full = r.toJsonValue(true);
    ASSERT_TRUE(full["transcript_summary"].contains("events"));
    EXPECT_EQ(full["transcript_summary"]["events"].size(), 6u);
    EXPECT_EQ(nlohmann::json::parse(r.toJson(true)), full);
}

TEST_F(ResultReporterTest, TranscriptEventsOmitUnobservedFields) {
    ResultReporter reporter;
    Transcript t;
    ChannelEvent lost = event(0, Basis::RECTILINEAR, 1, Basis::RECTILINEAR, 0);
    lost.lost = true;
    ChannelEvent tapped = event(1, Basis::DIAGONAL, 0, Basis::DIAGONAL, 1);
    tapped.intercepted = true;
    tapped.eveBasis = Basis::RECTILINEAR;
    tapped.eveBit = 1;
    t.events = {lost, tapped};
    SimulationConfig cfg;
    ASSERT_TRUE(reporter.finalize(cfg, 3, t, reconciled({1, 0}, {1, 0}, {0}),
                                  {RunState::INIT, RunState::ACCEPTED}).ok());
    nlohmann::json events = reporter.report().toJsonValue(true)["transcript_summary"]["events"];
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(events[0]["lost"].get<bool>());
    EXPECT_FALSE(events[0].contains("receiver_bit"));
    EXPECT_FALSE(events[0].contains("eve_basis"));
    EXPECT_EQ(events[1]["receiver_bit"], 1);
    EXPECT_EQ(events[1]["eve_basis"], basisToString(Basis::RECTILINEAR));
    EXPECT_EQ(events[1]["eve_bit"], 1);
}

TEST_F(ResultReporterTest, RejectedRunHasNoAmplifiedKey) {
    ResultReporter reporter;
    Transcript t;
    SimulationConfig cfg;
    ASSERT_TRUE(reporter.finalize(cfg, 1, t, reconciled({0, 0, 0, 0}, {1, 1, 0, 0}, {0, 2}),
                                  {RunState::INIT, RunState::REJECTED}).ok());
    const RunRecord& r = reporter.report();
    EXPECT_FALSE(r.secure);
    EXPECT_TRUE(r.privacyAmplifiedKey.empty());
    EXPECT_EQ(r.securityLevel, "Low");
    EXPECT_EQ(r.summary.finalKeyMismatches, 1u);
    EXPECT_TRUE(r.toJsonValue()["privacy_amplified_key"].is_null());
}

TEST_F(ResultReporterTest, FinalizeOnlyOnce) {
    ResultReporter reporter;
    Transcript t;
    SimulationConfig cfg;
    auto noPhases = reporter.finalize(cfg, 1, t, reconciled({1}, {1}, {0}), {});
    ASSERT_TRUE(noPhases.failed());
    EXPECT_EQ(noPhases.error().code, ErrorCode::INVALID_STATE);

    ASSERT_TRUE(reporter.finalize(cfg, 1, t, reconciled({1}, {1}, {0}), {RunState::ACCEPTED}).ok());
    auto again = reporter.finalize(cfg, 1, t, reconciled({1}, {1}, {0}), {RunState::ACCEPTED});
    ASSERT_TRUE(again.failed());
    EXPECT_EQ(again.error().code, ErrorCode::INVALID_STATE);
}
