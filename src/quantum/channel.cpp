#include "quantum/channel.h"
#include <string>

namespace qkdsim {
namespace quantum {

Result<uint8_t> Delivery::measure(Basis basis, RandomSource& rng) {
    if (lost) {
        return makeError(ErrorCode::INVALID_STATE, "cannot measure a lost unit");
    }
    auto outcome = unit.measure(basis, rng);
    if (outcome.failed()) return outcome;
    return static_cast<uint8_t>(outcome.value() ^ (noiseFlip ? 1 : 0));
}

Channel::Channel(double noiseProbability, double lossProbability)
    : noiseProbability_(noiseProbability), lossProbability_(lossProbability) {}

Result<void> Channel::validate() const {
    if (!(noiseProbability_ >= 0.0 && noiseProbability_ <= 1.0)) {
        return makeError(ErrorCode::INVALID_NOISE_PROBABILITY,
                         "channel noise probability must lie in [0,1], got " +
                         std::to_string(noiseProbability_));
    }
    if (!(lossProbability_ >= 0.0 && lossProbability_ <= 1.0)) {
        return makeError(ErrorCode::INVALID_NOISE_PROBABILITY,
                         "channel loss probability must lie in [0,1], got " +
                         std::to_string(lossProbability_));
    }
    return {};
}

Result<Delivery> Channel::transmit(QuantumUnit unit, Eavesdropper* eve, RandomSource& rng) {
    auto valid = validate();
    if (valid.failed()) return valid.error();
    if (unit.isMeasured()) {
        return makeError(ErrorCode::ALREADY_MEASURED, "cannot transmit a measured unit");
    }
    transmitted_++;

    Delivery delivery;
    if (eve) {
        auto seen = eve->intercept(unit, rng);
        if (seen.failed()) return seen.error();
        delivery.interception = seen.value();
    }

    if (rng.bernoulli(lossProbability_)) {
        lost_++;
        delivery.lost = true;
        return std::move(delivery);
    }

    delivery.noiseFlip = rng.bernoulli(noiseProbability_);
    if (delivery.noiseFlip) flipped_++;
    delivery.unit = std::move(unit);
    return std::move(delivery);
}

}
}
