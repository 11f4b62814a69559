#include "core/EnvelopeGenerator.h"
#include "core/Logger.h"

namespace klang {

EnvelopeGenerator::EnvelopeGenerator()
    : EnvelopeGenerator(EnvelopeParameters{})
{
}

EnvelopeGenerator::EnvelopeGenerator(const EnvelopeParameters& params)
    : Block("EnvelopeGenerator"), envelope_(params)
{
    addInput("trigger", PortKind::messageInput);
    addOutput("out");
}

void EnvelopeGenerator::prepare(double sampleRate, int blockSize)
{
    Block::prepare(sampleRate, blockSize);
    if (sampleRate > 0.0)
        envelope_.setSampleInterval(1.0 / sampleRate);
}

void EnvelopeGenerator::update()
{
    input()->receive([this](const juce::MidiMessage& message) {
        if (message.isNoteOn())
            envelope_.gate(true);
        else if (message.isNoteOff())
            envelope_.gate(false);
        else
            KL_TRACE_RT("EnvelopeGenerator: ignoring message");
    });

    auto& out = output()->getBuffer();
    envelope_.sample(out.getWritePointer(0), out.getNumSamples());
}

} // namespace klang
