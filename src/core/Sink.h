#pragma once

#include "core/Config.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <string>
#include <vector>

namespace klang {

/// Destination for the buffers a run renders, one write per cycle.
/// The engine opens the sink before the first cycle and always closes it
/// when the run ends, including after a failed write.
class Sink {
public:
    virtual ~Sink() = default;

    virtual bool open(const EngineConfig& config, std::string& error) = 0;
    virtual bool write(const juce::AudioBuffer<float>& buffer, std::string& error) = 0;
    virtual void close() = 0;
};

/// Keeps every rendered buffer in memory.
class MemorySink : public Sink {
public:
    bool open(const EngineConfig& config, std::string& error) override;
    bool write(const juce::AudioBuffer<float>& buffer, std::string& error) override;
    void close() override { open_ = false; }

    bool isOpen() const { return open_; }
    int getNumWrites() const { return static_cast<int>(chunks_.size()); }
    int getNumChannels() const { return numChannels_; }
    int getNumSamples() const;
    const juce::AudioBuffer<float>& getChunk(int index) const;

    // Every sample written to one channel, in order.
    std::vector<float> getChannel(int channel) const;

    void clear() { chunks_.clear(); }

private:
    std::vector<juce::AudioBuffer<float>> chunks_;
    int numChannels_ = 0;
    bool open_ = false;
};

} // namespace klang
