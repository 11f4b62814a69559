#include "core/RingBufferFilter.h"
#include "core/Logger.h"

namespace klang {

namespace {

std::unique_ptr<RingBuffer> makeRing(const char* name, int length, std::string& error)
{
    auto ring = RingBuffer::create(length, error);
    if (!ring)
        KL_WARN("%s::create: %s", name, error.c_str());
    return ring;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// RingBufferFilter
// ═══════════════════════════════════════════════════════════════════

RingBufferFilter::RingBufferFilter(const std::string& name, std::unique_ptr<RingBuffer> ring,
                                   float alpha)
    : Block(name), ring_(std::move(ring)), alpha_(alpha)
{
    addInput("in");
    addOutput("out");
}

void RingBufferFilter::filter(const float* x, float* y, int numSamples)
{
    const double alpha = getAlpha();
    for (int i = 0; i < numSamples; ++i)
        y[i] = static_cast<float>(processSample(x[i], alpha));
}

void RingBufferFilter::update()
{
    const auto& in = input()->getValue();
    auto& out = output()->getBuffer();
    int numSamples = juce::jmin(in.getNumSamples(), out.getNumSamples());
    filter(in.getReadPointer(0), out.getWritePointer(0), numSamples);
}

// ═══════════════════════════════════════════════════════════════════
// Comb and echo wiring
// ═══════════════════════════════════════════════════════════════════

std::unique_ptr<ForwardCombFilter> ForwardCombFilter::create(int length, float alpha,
                                                             std::string& error)
{
    auto ring = makeRing("ForwardCombFilter", length, error);
    if (!ring) return nullptr;
    return std::unique_ptr<ForwardCombFilter>(new ForwardCombFilter("ForwardCombFilter", std::move(ring), alpha));
}

double ForwardCombFilter::processSample(double x, double alpha)
{
    double y = x + alpha * ring().peek();
    ring().append(x);
    return y;
}

std::unique_ptr<BackwardCombFilter> BackwardCombFilter::create(int length, float alpha,
                                                               std::string& error)
{
    auto ring = makeRing("BackwardCombFilter", length, error);
    if (!ring) return nullptr;
    return std::unique_ptr<BackwardCombFilter>(new BackwardCombFilter("BackwardCombFilter", std::move(ring), alpha));
}

double BackwardCombFilter::processSample(double x, double alpha)
{
    double y = x + alpha * ring().peek();
    ring().append(y);
    return y;
}

std::unique_ptr<EchoFilter> EchoFilter::create(int length, float alpha, std::string& error)
{
    auto ring = makeRing("EchoFilter", length, error);
    if (!ring) return nullptr;
    return std::unique_ptr<EchoFilter>(new EchoFilter("EchoFilter", std::move(ring), alpha));
}

double EchoFilter::processSample(double x, double alpha)
{
    double y = ring().peek();
    ring().append(alpha * y + x);
    return y;
}

} // namespace klang
