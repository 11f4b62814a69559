#pragma once

#include "core/Config.h"
#include "core/Scheduler.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace klang {

class Block;
class Dac;
class Patch;
class Port;
class Sink;

// One-cycle delay on a back-edge: the consumer reads `delayed`, refreshed
// from the producer's output after every cycle.
struct FeedbackTap {
    Port* source;
    Port* dest;
    juce::AudioBuffer<float> delayed;
};

struct MessageRoute {
    Port* output;
    std::vector<Port*> targets;
};

/// Everything derived from the patch for one run. Rebuilt whenever the patch
/// version moves; the cycle counter survives rebuilds.
struct RunContext {
    std::vector<int> seeds;   // block handles
    std::vector<Block*> network;
    ExecutionOrder order;
    std::vector<std::unique_ptr<FeedbackTap>> taps;
    std::vector<MessageRoute> routes;
    Dac* dac = nullptr;
    uint64_t version = 0;
    int64_t cycle = 0;
    juce::AudioBuffer<float> rendered;   // numOutputChannels x blockSize
};

/// Drives cycles over the blocks reachable from a set of seeds.
///
/// A run holds the patch lock for each cycle, so control threads may edit the
/// patch between cycles. stop() may be called from any thread and takes
/// effect at the next cycle boundary.
class Engine {
public:
    explicit Engine(Patch& patch, const EngineConfig& config = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    const EngineConfig& getConfig() const { return config_; }
    Patch& getPatch() const { return patch_; }

    // --- Runs (control thread; return after completion or stop) ---
    bool run(const std::vector<Block*>& seeds, int64_t numCycles, Sink* sink,
             std::string& error);
    bool runFor(const std::vector<Block*>& seeds, double seconds, Sink* sink,
                std::string& error);
    bool runUntilStopped(const std::vector<Block*>& seeds, Sink* sink, std::string& error);

    // --- Any thread ---
    void stop();
    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    int64_t getCycleCount() const { return cycleCount_.load(std::memory_order_relaxed); }

    // --- Stepping (used by the run loop; exposed for tests) ---
    bool buildContext(const std::vector<int>& seeds, RunContext& ctx, std::string& error);
    bool processCycle(RunContext& ctx, Sink* sink, std::string& error);

private:
    bool runCycles(const std::vector<Block*>& seeds, int64_t numCycles, Sink* sink,
                   std::string& error);
    void render(RunContext& ctx) const;

    Patch& patch_;
    EngineConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::atomic<int64_t> cycleCount_{0};
};

} // namespace klang
