#include "core/Dac.h"

namespace klang {

Dac::Dac(int numChannels)
    : Block("Dac")
{
    for (int i = 0; i < juce::jmax(1, numChannels); ++i)
        addInput("in" + std::to_string(i));
}

void Dac::prepare(double sampleRate, int blockSize)
{
    Block::prepare(sampleRate, blockSize);
    rendered_.setSize(getNumInputs(), blockSize, false, true, true);
    rendered_.clear();
}

void Dac::update()
{
    for (int ch = 0; ch < getNumInputs(); ++ch)
    {
        const auto& in = getInput(ch)->getValue();
        int numSamples = juce::jmin(rendered_.getNumSamples(), in.getNumSamples());
        rendered_.copyFrom(ch, 0, in, 0, 0, numSamples);
    }
}

} // namespace klang
