#ifndef QKDSIM_CHANNEL_H
#define QKDSIM_CHANNEL_H

#include "quantum/quantum_unit.h"
#include "quantum/eavesdropper.h"

namespace qkdsim {
namespace quantum {

// What arrives at the receiver for one transmitted unit.
struct Delivery {
    QuantumUnit unit;
    Interception interception;
    bool lost = false;
    bool noiseFlip = false;

    // Receiver measurement with the channel's bit flip applied.
    Result<uint8_t> measure(Basis basis, RandomSource& rng);
};

class Channel {
public:
    Channel(double noiseProbability, double lossProbability);

    Result<void> validate() const;

    Result<Delivery> transmit(QuantumUnit unit, Eavesdropper* eve, RandomSource& rng);

    double noiseProbability() const { return noiseProbability_; }
    double lossProbability() const { return lossProbability_; }

    size_t transmitted() const { return transmitted_; }
    size_t lost() const { return lost_; }
    size_t flipped() const { return flipped_; }

private:
    double noiseProbability_;
    double lossProbability_;
    size_t transmitted_ = 0;
    size_t lost_ = 0;
    size_t flipped_ = 0;
};

}
}

#endif
