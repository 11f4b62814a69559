#pragma once

#include "core/Block.h"
#include "core/Config.h"
#include "core/RingBuffer.h"

#include <atomic>
#include <memory>
#include <string>

namespace klang {

/// Mono feedback delay with dry/wet blend.
class Delay : public Block {
public:
    static constexpr double kMaxTime = 2.0;  // seconds
    static constexpr int kMaxLength = static_cast<int>(kMaxTime * kDefaultSampleRate);

    static std::unique_ptr<Delay> create(int lengthInSamples, float feedback, float drywet,
                                         std::string& error);
    static std::unique_ptr<Delay> create(double seconds, double sampleRate, float feedback,
                                         float drywet, std::string& error);

    void update() override;

    int getLength() const { return ring_->getLength(); }
    float getFeedback() const { return feedback_.load(std::memory_order_relaxed); }
    void setFeedback(float feedback) { feedback_.store(feedback, std::memory_order_relaxed); }
    float getDryWet() const { return drywet_.load(std::memory_order_relaxed); }
    bool setDryWet(float drywet);

private:
    Delay(std::unique_ptr<RingBuffer> ring, float feedback, float drywet);

    std::unique_ptr<RingBuffer> ring_;
    std::atomic<float> feedback_;
    std::atomic<float> drywet_;
};

} // namespace klang
