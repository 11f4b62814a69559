#include "core/Engine.h"
#include "core/Block.h"
#include "core/Dac.h"
#include "core/Logger.h"
#include "core/Network.h"
#include "core/Patch.h"
#include "core/Sink.h"

#include <chrono>
#include <cmath>
#include <thread>

namespace klang {

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

Engine::Engine(Patch& patch, const EngineConfig& config)
    : patch_(patch), config_(config)
{
    KL_INFO("Engine: created sr=%.0f bs=%d ch=%d realtime=%d", config_.sampleRate,
            config_.blockSize, config_.numOutputChannels, config_.realtime ? 1 : 0);
}

Engine::~Engine()
{
    jassert(!isRunning());
    KL_INFO("Engine: destroyed after %lld cycles", static_cast<long long>(getCycleCount()));
}

// ═══════════════════════════════════════════════════════════════════
// Run entry points
// ═══════════════════════════════════════════════════════════════════

bool Engine::run(const std::vector<Block*>& seeds, int64_t numCycles, Sink* sink,
                 std::string& error)
{
    if (numCycles < 0)
    {
        error = "cycle count must not be negative";
        KL_WARN("Engine::run: %s", error.c_str());
        return false;
    }
    return runCycles(seeds, numCycles, sink, error);
}

bool Engine::runFor(const std::vector<Block*>& seeds, double seconds, Sink* sink,
                    std::string& error)
{
    if (!(seconds >= 0.0) || !std::isfinite(seconds))
    {
        error = "duration must be finite and not negative";
        KL_WARN("Engine::runFor: %s", error.c_str());
        return false;
    }
    auto numCycles = static_cast<int64_t>(
        std::ceil(seconds * config_.sampleRate / config_.blockSize));
    return runCycles(seeds, numCycles, sink, error);
}

bool Engine::runUntilStopped(const std::vector<Block*>& seeds, Sink* sink, std::string& error)
{
    return runCycles(seeds, -1, sink, error);
}

void Engine::stop()
{
    stopRequested_.store(true, std::memory_order_release);
    KL_DEBUG("Engine::stop requested");
}

bool Engine::runCycles(const std::vector<Block*>& seeds, int64_t numCycles, Sink* sink,
                       std::string& error)
{
    if (!isValid(config_, error))
    {
        KL_WARN("Engine: invalid config: %s", error.c_str());
        return false;
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        error = "engine is already running";
        KL_WARN("Engine: %s", error.c_str());
        return false;
    }
    stopRequested_.store(false, std::memory_order_release);
    cycleCount_.store(0, std::memory_order_relaxed);

    std::vector<int> handles;
    handles.reserve(seeds.size());
    for (Block* seed : seeds)
        if (seed) handles.push_back(seed->getHandle());

    RunContext ctx;
    bool ok = buildContext(handles, ctx, error);

    bool sinkOpen = false;
    if (ok && sink)
    {
        if (!ctx.dac)
        {
            error = "a sink needs a Dac block in the network";
            KL_WARN("Engine: %s", error.c_str());
            ok = false;
        }
        else
        {
            ok = sinkOpen = sink->open(config_, error);
        }
    }

    KL_INFO("Engine: run start (%d blocks, %lld cycles)", static_cast<int>(ctx.network.size()),
            static_cast<long long>(numCycles));

    using Clock = std::chrono::steady_clock;
    const auto cycleDuration = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(config_.getCycleDuration()));
    auto deadline = Clock::now();

    while (ok && (numCycles < 0 || ctx.cycle < numCycles)
           && !stopRequested_.load(std::memory_order_acquire))
    {
        ok = processCycle(ctx, sink, error);
        cycleCount_.store(ctx.cycle, std::memory_order_relaxed);

        if (config_.realtime)
        {
            deadline += cycleDuration;
            std::this_thread::sleep_until(deadline);
        }
    }

    if (sinkOpen)
        sink->close();

    {
        // Drop the feedback taps: inputs read their live sources again.
        const juce::ScopedLock sl(patch_.getLock());
        patch_.refreshBindings();
    }

    if (ok)
        KL_INFO("Engine: run finished after %lld cycles", static_cast<long long>(ctx.cycle));
    else
        KL_WARN("Engine: run aborted after %lld cycles: %s",
                static_cast<long long>(ctx.cycle), error.c_str());

    Logger::drain();
    running_.store(false, std::memory_order_release);
    return ok;
}

// ═══════════════════════════════════════════════════════════════════
// Run context
// ═══════════════════════════════════════════════════════════════════

bool Engine::buildContext(const std::vector<int>& seeds, RunContext& ctx, std::string& error)
{
    const juce::ScopedLock sl(patch_.getLock());

    std::vector<Block*> seedBlocks;
    for (int handle : seeds)
    {
        if (Block* block = patch_.getBlock(handle))
            seedBlocks.push_back(block);
        else
            KL_WARN("Engine: seed handle=%d is no longer in the patch", handle);
    }

    ctx.seeds = seeds;
    ctx.network = Network::discover(patch_, seedBlocks);
    if (!Scheduler::order(patch_, ctx.network, ctx.order, error))
    {
        KL_WARN("Engine: scheduling failed: %s", error.c_str());
        return false;
    }

    patch_.refreshBindings();
    for (Block* block : ctx.order.blocks)
        block->prepare(config_.sampleRate, config_.blockSize);

    // Taps start from the producer's current output, which is its most
    // recent cycle (silence before the first one).
    ctx.taps.clear();
    for (const auto& edge : ctx.order.feedbackEdges)
    {
        auto tap = std::make_unique<FeedbackTap>();
        tap->source = edge.source;
        tap->dest = edge.dest;
        tap->delayed.makeCopyOf(edge.source->getBuffer());
        edge.dest->bind(&tap->delayed);
        ctx.taps.push_back(std::move(tap));
    }

    ctx.routes.clear();
    ctx.dac = nullptr;
    for (Block* block : ctx.order.blocks)
    {
        for (int i = 0; i < block->getNumOutputs(); ++i)
        {
            Port* out = block->getOutput(i);
            if (out->getKind() == PortKind::messageOutput)
                ctx.routes.push_back({out, patch_.resolveTargets(*out)});
        }
        if (!ctx.dac)
            ctx.dac = dynamic_cast<Dac*>(block);
    }

    ctx.rendered.setSize(config_.numOutputChannels, config_.blockSize, false, true, true);
    ctx.rendered.clear();
    ctx.version = patch_.getVersion();

    KL_DEBUG("Engine: context built: %d blocks, %d feedback taps, %d message routes, dac=%s",
             static_cast<int>(ctx.order.blocks.size()), static_cast<int>(ctx.taps.size()),
             static_cast<int>(ctx.routes.size()), ctx.dac ? ctx.dac->describe().c_str() : "none");
    return true;
}

bool Engine::processCycle(RunContext& ctx, Sink* sink, std::string& error)
{
    {
        const juce::ScopedLock sl(patch_.getLock());

        if (patch_.getVersion() != ctx.version)
        {
            KL_DEBUG("Engine: patch changed at cycle %lld, rescheduling",
                     static_cast<long long>(ctx.cycle));
            if (!buildContext(ctx.seeds, ctx, error))
                return false;
            Logger::drain();
            if (sink && !ctx.dac)
            {
                error = "the Dac block left the network";
                KL_WARN("Engine: %s", error.c_str());
                return false;
            }
        }

        // 1. Messages staged last cycle, oldest first per output
        for (auto& route : ctx.routes)
        {
            route.output->flush([&route](const juce::MidiMessage& message) {
                for (Port* target : route.targets)
                    target->push(message);
            });
        }

        // 2. Blocks in schedule order
        for (Block* block : ctx.order.blocks)
            block->update();

        // 3. Feedback taps take this cycle's output for the next one
        for (auto& tap : ctx.taps)
            tap->delayed.makeCopyOf(tap->source->getBuffer(), true);

        if (sink)
            render(ctx);
    }

    ++ctx.cycle;
    KL_TRACE_RT("Engine: cycle %lld done", static_cast<long long>(ctx.cycle));

    // 4. Sink write outside the patch lock
    if (sink && !sink->write(ctx.rendered, error))
    {
        KL_WARN("Engine: sink write failed: %s", error.c_str());
        return false;
    }
    return true;
}

void Engine::render(RunContext& ctx) const
{
    ctx.rendered.clear();
    if (!ctx.dac) return;

    const auto& source = ctx.dac->getRendered();
    int numChannels = juce::jmin(ctx.rendered.getNumChannels(), source.getNumChannels());
    int numSamples = juce::jmin(ctx.rendered.getNumSamples(), source.getNumSamples());
    for (int ch = 0; ch < numChannels; ++ch)
        ctx.rendered.copyFrom(ch, 0, source, ch, 0, numSamples);
}

} // namespace klang
