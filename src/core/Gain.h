#pragma once

#include "core/Block.h"

namespace klang {

/// Multiplies its signal input by its gain input, sample by sample.
/// An unconnected gain input reads its default (1, or whatever setGain set).
class Gain : public Block {
public:
    explicit Gain(float gain = 1.0f)
        : Block("Gain")
    {
        addInput("in");
        addInput("gain").setDefaultValue(gain);
        addOutput("out");
    }

    // Control thread. Lands between two cycles.
    void setGain(float gain)
    {
        const juce::ScopedLock sl(getStructureLock());
        getInput(1)->setDefaultValue(gain);
    }

    float getGain() const
    {
        const juce::ScopedLock sl(getStructureLock());
        return getInput(1)->getDefaultValue();
    }

    void update() override
    {
        auto& out = output()->getBuffer();
        const auto& in = getInput(0)->getValue();
        const auto& gain = getInput(1)->getValue();
        int numSamples = juce::jmin(out.getNumSamples(), in.getNumSamples(), gain.getNumSamples());
        juce::FloatVectorOperations::multiply(out.getWritePointer(0), in.getReadPointer(0),
                                              gain.getReadPointer(0), numSamples);
    }
};

} // namespace klang
