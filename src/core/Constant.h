#pragma once

#include "core/Block.h"

#include <atomic>

namespace klang {

/// Fills its output with a fixed level every cycle.
class Constant : public Block {
public:
    explicit Constant(float level = 1.0f, int channels = 1)
        : Block("Constant"), level_(level)
    {
        addOutput("out", PortKind::valueOutput, channels);
    }

    void setLevel(float level) { level_.store(level, std::memory_order_relaxed); }
    float getLevel() const { return level_.load(std::memory_order_relaxed); }

    void update() override
    {
        auto& out = output()->getBuffer();
        float level = getLevel();
        for (int ch = 0; ch < out.getNumChannels(); ++ch)
            juce::FloatVectorOperations::fill(out.getWritePointer(ch), level, out.getNumSamples());
    }

private:
    std::atomic<float> level_;
};

} // namespace klang
