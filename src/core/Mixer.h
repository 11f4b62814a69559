#pragma once

#include "core/Block.h"

#include <vector>

namespace klang {

/// Sums any number of value channels into one output.
///
/// Unconnected channels read their default of zero, so the output shape does
/// not depend on how many channels are wired. Channels may be added while a
/// run is in progress; the new channel joins at the next scheduling pass.
class Mixer : public Block {
public:
    explicit Mixer(int numChannels = 0, int outputChannels = 1);

    void update() override;

    // Appends an unconnected channel input and returns its index.
    int addChannel();
    int getNumChannels() const { return getNumInputs(); }
    Port* getChannel(int index) const { return getInput(index); }

    // Per-channel gain, clipped to [0, 1]. Default 1.
    bool setGain(int channel, float gain);
    float getGain(int channel) const;

private:
    int outputChannels_;
    std::vector<float> gains_;
};

} // namespace klang
