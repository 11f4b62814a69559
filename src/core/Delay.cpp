#include "core/Delay.h"
#include "core/Logger.h"

#include <cmath>

namespace klang {

std::unique_ptr<Delay> Delay::create(int lengthInSamples, float feedback, float drywet,
                                     std::string& error)
{
    if (lengthInSamples > kMaxLength)
    {
        error = "delay of " + std::to_string(lengthInSamples) + " samples exceeds "
              + std::to_string(kMaxLength);
        KL_WARN("Delay::create: %s", error.c_str());
        return nullptr;
    }
    if (!(drywet >= 0.0f && drywet <= 1.0f))
    {
        error = "dry/wet must lie in [0, 1]";
        KL_WARN("Delay::create: %s", error.c_str());
        return nullptr;
    }

    auto ring = RingBuffer::create(lengthInSamples, error);
    if (!ring)
    {
        KL_WARN("Delay::create: %s", error.c_str());
        return nullptr;
    }
    return std::unique_ptr<Delay>(new Delay(std::move(ring), feedback, drywet));
}

std::unique_ptr<Delay> Delay::create(double seconds, double sampleRate, float feedback,
                                     float drywet, std::string& error)
{
    if (!(seconds > 0.0) || seconds > kMaxTime || !(sampleRate > 0.0))
    {
        error = "delay time must lie in (0, " + std::to_string(kMaxTime) + "] seconds";
        KL_WARN("Delay::create: %s", error.c_str());
        return nullptr;
    }
    int length = static_cast<int>(std::lround(seconds * sampleRate));
    return create(juce::jmax(1, length), feedback, drywet, error);
}

Delay::Delay(std::unique_ptr<RingBuffer> ring, float feedback, float drywet)
    : Block("Delay"), ring_(std::move(ring)), feedback_(feedback), drywet_(drywet)
{
    addInput("in");
    addOutput("out");
}

bool Delay::setDryWet(float drywet)
{
    if (!(drywet >= 0.0f && drywet <= 1.0f))
    {
        KL_WARN("Delay::setDryWet: %f outside [0, 1]", static_cast<double>(drywet));
        return false;
    }
    drywet_.store(drywet, std::memory_order_relaxed);
    return true;
}

void Delay::update()
{
    const auto& in = input()->getValue();
    auto& out = output()->getBuffer();
    int numSamples = juce::jmin(in.getNumSamples(), out.getNumSamples());

    const float* x = in.getReadPointer(0);
    float* y = out.getWritePointer(0);
    const double feedback = getFeedback();
    const double wet = getDryWet();

    for (int i = 0; i < numSamples; ++i)
    {
        double old = ring_->peek();
        ring_->append(x[i] + feedback * old);
        y[i] = static_cast<float>((1.0 - wet) * x[i] + wet * old);
    }
}

} // namespace klang
