#pragma once

#include "core/Block.h"
#include "core/RingBuffer.h"

#include <atomic>
#include <memory>
#include <string>

namespace klang {

constexpr float kDefaultFilterAlpha = 0.9f;

/// Single-channel filter built on a RingBuffer. Subclasses differ only in
/// which signal they feed back into the delay line.
class RingBufferFilter : public Block {
public:
    void update() override;

    // Filters numSamples from x into y, one sample at a time. State carries
    // across calls. x and y may alias.
    void filter(const float* x, float* y, int numSamples);

    float getAlpha() const { return alpha_.load(std::memory_order_relaxed); }
    void setAlpha(float alpha) { alpha_.store(alpha, std::memory_order_relaxed); }
    int getLength() const { return ring_->getLength(); }

    void clear() { ring_->clear(); }

protected:
    RingBufferFilter(const std::string& name, std::unique_ptr<RingBuffer> ring, float alpha);

    virtual double processSample(double x, double alpha) = 0;

    RingBuffer& ring() { return *ring_; }

private:
    std::unique_ptr<RingBuffer> ring_;
    std::atomic<float> alpha_;
};

/// y = x + a * delayed(x)
class ForwardCombFilter : public RingBufferFilter {
public:
    static std::unique_ptr<ForwardCombFilter> create(int length, float alpha, std::string& error);
    static std::unique_ptr<ForwardCombFilter> create(int length, std::string& error)
    {
        return create(length, kDefaultFilterAlpha, error);
    }

protected:
    using RingBufferFilter::RingBufferFilter;

    double processSample(double x, double alpha) override;
};

/// y = x + a * delayed(y)
class BackwardCombFilter : public RingBufferFilter {
public:
    static std::unique_ptr<BackwardCombFilter> create(int length, float alpha, std::string& error);
    static std::unique_ptr<BackwardCombFilter> create(int length, std::string& error)
    {
        return create(length, kDefaultFilterAlpha, error);
    }

protected:
    using RingBufferFilter::RingBufferFilter;

    double processSample(double x, double alpha) override;
};

/// Wet-only echo: y = delayed(a * y + x)
class EchoFilter : public RingBufferFilter {
public:
    static std::unique_ptr<EchoFilter> create(int length, float alpha, std::string& error);
    static std::unique_ptr<EchoFilter> create(int length, std::string& error)
    {
        return create(length, kDefaultFilterAlpha, error);
    }

protected:
    using RingBufferFilter::RingBufferFilter;

    double processSample(double x, double alpha) override;
};

} // namespace klang
