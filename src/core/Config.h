#pragma once

#include <string>

namespace klang {

constexpr double kDefaultSampleRate = 44100.0;
constexpr int kDefaultBlockSize = 256;
constexpr double kConcertPitch = 440.0;

// Hard ceiling for any ring buffer: 60 seconds at the reference rate.
constexpr int kMaxRingBufferCapacity = 60 * 44100;

struct EngineConfig {
    double sampleRate = kDefaultSampleRate;
    int blockSize = kDefaultBlockSize;
    int numOutputChannels = 1;  // channels handed to the sink per cycle
    bool realtime = false;      // pace cycles to wall-clock time

    double getSampleInterval() const { return 1.0 / sampleRate; }
    double getCycleDuration() const { return blockSize / sampleRate; }
};

inline bool isValid(const EngineConfig& config, std::string& error)
{
    if (!(config.sampleRate > 0.0))
    {
        error = "sample rate must be positive";
        return false;
    }
    if (config.blockSize < 1)
    {
        error = "block size must be at least 1";
        return false;
    }
    if (config.numOutputChannels < 1)
    {
        error = "output channel count must be at least 1";
        return false;
    }
    return true;
}

} // namespace klang
