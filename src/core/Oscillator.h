#pragma once

#include "core/Block.h"
#include "core/Config.h"

namespace klang {

/// Sine generator driven by a per-sample frequency input (Hz).
/// Phase carries across cycles and across re-prepares.
class Oscillator : public Block {
public:
    explicit Oscillator(float frequency = static_cast<float>(kConcertPitch));

    // Control thread. Lands between two cycles.
    void setFrequency(float hz);
    float getFrequency() const;
    double getPhase() const { return phase_; }

    void update() override;

private:
    double phase_ = 0.0;   // in cycles, [0, 1)
};

} // namespace klang
