#include "core/Port.h"
#include "core/Block.h"
#include "core/Logger.h"

namespace klang {

const char* portKindName(PortKind kind)
{
    switch (kind)
    {
        case PortKind::valueInput:    return "ValueInput";
        case PortKind::valueOutput:   return "ValueOutput";
        case PortKind::messageInput:  return "MessageInput";
        case PortKind::messageOutput: return "MessageOutput";
        case PortKind::valueRelay:    return "ValueRelay";
        case PortKind::messageRelay:  return "MessageRelay";
    }
    return "unknown";
}

bool isValueKind(PortKind kind)
{
    return kind == PortKind::valueInput || kind == PortKind::valueOutput
        || kind == PortKind::valueRelay;
}

bool isMessageKind(PortKind kind)
{
    return !isValueKind(kind);
}

bool isRelay(PortKind kind)
{
    return kind == PortKind::valueRelay || kind == PortKind::messageRelay;
}

bool canSend(PortKind kind)
{
    return kind == PortKind::valueOutput || kind == PortKind::messageOutput || isRelay(kind);
}

bool canReceive(PortKind kind)
{
    return kind == PortKind::valueInput || kind == PortKind::messageInput || isRelay(kind);
}

bool canConnect(PortKind source, PortKind dest)
{
    if (!canSend(source) || !canReceive(dest))
        return false;
    // Relays unify with their underlying family only.
    return isValueKind(source) == isValueKind(dest);
}

// ═══════════════════════════════════════════════════════════════════
// Port
// ═══════════════════════════════════════════════════════════════════

Port::Port(Block& owner, PortSide side, int index, const std::string& name,
           PortKind kind, int channels)
    : owner_(owner), side_(side), index_(index), name_(name), kind_(kind),
      channels_(channels < 1 ? 1 : channels)
{
}

PortAddress Port::getAddress() const
{
    return {owner_.getHandle(), side_, index_};
}

void Port::prepare(int blockSize)
{
    if (kind_ != PortKind::valueInput && kind_ != PortKind::valueOutput)
        return;

    if (buffer_.getNumChannels() == channels_ && buffer_.getNumSamples() == blockSize)
        return;

    // Outputs keep their content so a re-prepare mid-run does not blank the
    // previous cycle's value; inputs are refilled with their default.
    buffer_.setSize(channels_, blockSize, kind_ == PortKind::valueOutput, true, true);
    if (kind_ == PortKind::valueInput)
        setDefaultValue(defaultValue_);
}

void Port::setDefaultValue(float value)
{
    defaultValue_ = value;
    for (int ch = 0; ch < buffer_.getNumChannels(); ++ch)
        juce::FloatVectorOperations::fill(buffer_.getWritePointer(ch), value,
                                          buffer_.getNumSamples());
}

void Port::push(const juce::MidiMessage& message)
{
    queue_.push_back(message);
}

bool Port::receiveLatest(juce::MidiMessage& message)
{
    if (queue_.empty())
        return false;
    message = std::move(queue_.back());
    queue_.clear();
    return true;
}

void Port::send(const juce::MidiMessage& message)
{
    if (kind_ != PortKind::messageOutput)
    {
        KL_WARN("Port::send: '%s' is a %s, not a message output",
                name_.c_str(), portKindName(kind_));
        return;
    }
    queue_.push_back(message);
}

} // namespace klang
