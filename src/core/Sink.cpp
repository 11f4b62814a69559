#include "core/Sink.h"
#include "core/Logger.h"

namespace klang {

bool MemorySink::open(const EngineConfig& config, std::string& error)
{
    if (!isValid(config, error))
    {
        KL_WARN("MemorySink::open: %s", error.c_str());
        return false;
    }
    numChannels_ = config.numOutputChannels;
    open_ = true;
    return true;
}

bool MemorySink::write(const juce::AudioBuffer<float>& buffer, std::string& error)
{
    if (!open_)
    {
        error = "memory sink is not open";
        KL_WARN("MemorySink::write: %s", error.c_str());
        return false;
    }
    chunks_.emplace_back(buffer);
    return true;
}

int MemorySink::getNumSamples() const
{
    int total = 0;
    for (const auto& chunk : chunks_)
        total += chunk.getNumSamples();
    return total;
}

const juce::AudioBuffer<float>& MemorySink::getChunk(int index) const
{
    jassert(index >= 0 && index < getNumWrites());
    return chunks_[static_cast<size_t>(index)];
}

std::vector<float> MemorySink::getChannel(int channel) const
{
    std::vector<float> samples;
    samples.reserve(static_cast<size_t>(getNumSamples()));
    for (const auto& chunk : chunks_)
    {
        if (channel < 0 || channel >= chunk.getNumChannels())
            continue;
        const float* data = chunk.getReadPointer(channel);
        samples.insert(samples.end(), data, data + chunk.getNumSamples());
    }
    return samples;
}

} // namespace klang
