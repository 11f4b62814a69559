#pragma once

#include "core/Block.h"

namespace klang {

/// Terminal block whose inputs are the channels handed to the run's sink.
/// The engine renders the first Dac in execution order.
class Dac : public Block {
public:
    explicit Dac(int numChannels = 1);

    void prepare(double sampleRate, int blockSize) override;
    void update() override;

    int getNumChannels() const { return getNumInputs(); }

    // One channel per input, as of the last update().
    const juce::AudioBuffer<float>& getRendered() const { return rendered_; }

private:
    juce::AudioBuffer<float> rendered_;
};

} // namespace klang
