#pragma once

#include "core/Block.h"
#include "core/SPSCQueue.h"

#include <atomic>

namespace klang {

/// Entry point for messages produced on another thread (a device callback,
/// a UI). One producer thread calls post(); the engine thread forwards
/// everything queued to the message output at the start of its update.
class MessageInlet : public Block {
public:
    static constexpr int kCapacity = 1024;

    MessageInlet();

    // Producer thread. Returns false and counts a drop when the queue is full.
    bool post(const juce::MidiMessage& message);

    void update() override;

    int getNumQueued() const { return queue_.size(); }
    int getDropCount() const { return dropped_.load(std::memory_order_relaxed); }

private:
    SPSCQueue<juce::MidiMessage, kCapacity> queue_;
    std::atomic<int> dropped_{0};
};

} // namespace klang
