#include "core/Oscillator.h"

#include <cmath>

namespace klang {

Oscillator::Oscillator(float frequency)
    : Block("Oscillator")
{
    addInput("frequency").setDefaultValue(frequency);
    addOutput("out");
}

void Oscillator::setFrequency(float hz)
{
    const juce::ScopedLock sl(getStructureLock());
    input()->setDefaultValue(hz);
}

float Oscillator::getFrequency() const
{
    const juce::ScopedLock sl(getStructureLock());
    return getInput(0)->getDefaultValue();
}

void Oscillator::update()
{
    auto& out = output()->getBuffer();
    const auto& freq = input()->getValue();
    double rate = getSampleRate() > 0.0 ? getSampleRate() : kDefaultSampleRate;

    float* dest = out.getWritePointer(0);
    const float* hz = freq.getReadPointer(0);
    int numSamples = juce::jmin(out.getNumSamples(), freq.getNumSamples());

    for (int i = 0; i < numSamples; ++i)
    {
        dest[i] = static_cast<float>(std::sin(juce::MathConstants<double>::twoPi * phase_));
        phase_ += hz[i] / rate;
        phase_ -= std::floor(phase_);
    }
}

} // namespace klang
