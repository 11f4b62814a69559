#include "core/MessageInlet.h"
#include "core/Logger.h"

namespace klang {

MessageInlet::MessageInlet()
    : Block("MessageInlet")
{
    addOutput("out", PortKind::messageOutput);
}

bool MessageInlet::post(const juce::MidiMessage& message)
{
    if (queue_.tryPush(message))
        return true;
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
}

void MessageInlet::update()
{
    Port* out = output();
    int count = queue_.drain([out](const juce::MidiMessage& message) { out->send(message); });
    if (count > 0)
        KL_TRACE_RT("MessageInlet: forwarded %d messages", count);
}

} // namespace klang
