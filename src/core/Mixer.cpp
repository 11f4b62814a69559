#include "core/Mixer.h"
#include "core/Logger.h"

namespace klang {

Mixer::Mixer(int numChannels, int outputChannels)
    : Block("Mixer"),
      outputChannels_(outputChannels < 1 ? 1 : outputChannels)
{
    addOutput("out", PortKind::valueOutput, outputChannels_);
    for (int i = 0; i < numChannels; ++i)
        addChannel();
}

int Mixer::addChannel()
{
    // Gains are read inside the cycle; grow them under the same lock that
    // publishes the new port.
    const juce::ScopedLock sl(getStructureLock());
    gains_.push_back(1.0f);
    Port& port = addInput("in" + std::to_string(getNumInputs()),
                          PortKind::valueInput, outputChannels_);
    return port.getIndex();
}

bool Mixer::setGain(int channel, float gain)
{
    const juce::ScopedLock sl(getStructureLock());
    if (channel < 0 || channel >= static_cast<int>(gains_.size()))
    {
        KL_WARN("Mixer::setGain: channel %d out of range (%d channels)",
                channel, static_cast<int>(gains_.size()));
        return false;
    }
    gains_[static_cast<size_t>(channel)] = juce::jlimit(0.0f, 1.0f, gain);
    return true;
}

float Mixer::getGain(int channel) const
{
    const juce::ScopedLock sl(getStructureLock());
    if (channel < 0 || channel >= static_cast<int>(gains_.size()))
        return 0.0f;
    return gains_[static_cast<size_t>(channel)];
}

void Mixer::update()
{
    auto& out = output()->getBuffer();
    out.clear();

    for (int i = 0; i < getNumInputs(); ++i)
    {
        const auto& in = getInput(i)->getValue();
        float gain = gains_[static_cast<size_t>(i)];
        int numSamples = juce::jmin(out.getNumSamples(), in.getNumSamples());
        int numChannels = juce::jmin(out.getNumChannels(), in.getNumChannels());
        for (int ch = 0; ch < numChannels; ++ch)
            out.addFrom(ch, 0, in, ch, 0, numSamples, gain);
    }
}

} // namespace klang
