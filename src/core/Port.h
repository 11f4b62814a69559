#pragma once

#include <juce_audio_basics/juce_audio_basics.h>

#include <deque>
#include <string>
#include <utility>

namespace klang {

class Block;

enum class PortKind {
    valueInput,
    valueOutput,
    messageInput,
    messageOutput,
    valueRelay,
    messageRelay
};

// Which of its owner's port lists a port lives in.
enum class PortSide { input, output };

const char* portKindName(PortKind kind);

bool isValueKind(PortKind kind);
bool isMessageKind(PortKind kind);
bool isRelay(PortKind kind);
bool canSend(PortKind kind);
bool canReceive(PortKind kind);
bool canConnect(PortKind source, PortKind dest);

struct PortAddress {
    int blockHandle;
    PortSide side;
    int index;

    bool operator==(const PortAddress& o) const {
        return blockHandle == o.blockHandle && side == o.side && index == o.index;
    }
    bool operator!=(const PortAddress& o) const { return !(*this == o); }
};

/// Typed endpoint owned by exactly one Block.
///
/// Value outputs hold the buffer their owner produced last. Value inputs read
/// whatever buffer they are bound to, or their own default buffer. Message
/// inputs keep an insertion-ordered inbox until drained; message outputs keep
/// a staging queue the engine flushes once per cycle.
class Port {
public:
    Port(Block& owner, PortSide side, int index, const std::string& name,
         PortKind kind, int channels);

    Port(const Port&) = delete;
    Port& operator=(const Port&) = delete;

    // --- Identity ---
    Block& getOwner() const { return owner_; }
    PortSide getSide() const { return side_; }
    int getIndex() const { return index_; }
    const std::string& getName() const { return name_; }
    PortKind getKind() const { return kind_; }
    int getNumChannels() const { return channels_; }
    PortAddress getAddress() const;

    // --- Buffers (control side) ---
    void prepare(int blockSize);

    // --- Value outputs ---
    juce::AudioBuffer<float>& getBuffer() { return buffer_; }
    const juce::AudioBuffer<float>& getBuffer() const { return buffer_; }

    // --- Value inputs ---
    void setDefaultValue(float value);
    float getDefaultValue() const { return defaultValue_; }
    const juce::AudioBuffer<float>& getValue() const { return source_ ? *source_ : buffer_; }
    bool isBound() const { return source_ != nullptr; }
    void bind(const juce::AudioBuffer<float>* source) { source_ = source; }

    // --- Message inputs ---
    void push(const juce::MidiMessage& message);
    bool receiveLatest(juce::MidiMessage& message);
    int getNumPending() const { return static_cast<int>(queue_.size()); }

    template<typename Handler>
    int receive(Handler&& handler)
    {
        int count = 0;
        while (!queue_.empty())
        {
            juce::MidiMessage message = std::move(queue_.front());
            queue_.pop_front();
            handler(message);
            ++count;
        }
        return count;
    }

    // --- Message outputs ---
    void send(const juce::MidiMessage& message);
    int getNumStaged() const { return static_cast<int>(queue_.size()); }

    // Hands staged messages, oldest first, to the handler and empties the queue.
    template<typename Handler>
    int flush(Handler&& handler)
    {
        return receive(std::forward<Handler>(handler));
    }

private:
    Block& owner_;
    PortSide side_;
    int index_;
    std::string name_;
    PortKind kind_;
    int channels_;

    juce::AudioBuffer<float> buffer_;
    const juce::AudioBuffer<float>* source_ = nullptr;
    float defaultValue_ = 0.0f;

    std::deque<juce::MidiMessage> queue_;
};

} // namespace klang
