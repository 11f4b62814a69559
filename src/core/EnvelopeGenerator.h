#pragma once

#include "core/Block.h"
#include "core/Envelope.h"

namespace klang {

/// Block wrapper around Envelope. Note-on messages on the trigger input open
/// the gate, note-off (or note-on with zero velocity) closes it; anything else
/// is ignored. Emits one envelope value per sample.
class EnvelopeGenerator : public Block {
public:
    EnvelopeGenerator();
    explicit EnvelopeGenerator(const EnvelopeParameters& params);

    void prepare(double sampleRate, int blockSize) override;
    void update() override;

    Envelope& getEnvelope() { return envelope_; }
    const Envelope& getEnvelope() const { return envelope_; }

private:
    Envelope envelope_;
};

} // namespace klang
