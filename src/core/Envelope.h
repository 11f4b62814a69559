#pragma once

#include "core/Config.h"

#include <juce_core/juce_core.h>

#include <string>

namespace klang {

enum class EnvelopeStage { off, attacking, decaying, sustaining, releasing };

const char* envelopeStageName(EnvelopeStage stage);

struct EnvelopeParameters {
    double attack = 0.01;                       // seconds
    double decay = 0.1;                         // seconds
    double sustain = 0.5;                       // level in [0, 1]
    double release = 0.2;                       // seconds
    double sampleInterval = 1.0 / kDefaultSampleRate;
    double overshoot = 1e-3;                    // clipped to [kMinOvershoot, kMaxOvershoot]
    bool retrigger = false;
    bool loop = false;
};

/// ADSR state machine with one-pole exponential segments.
///
/// Each of attack, decay and release aims past its target by `overshoot` so
/// the curve reaches the boundary in finite time; the value is clamped there
/// and the stage advances. Time only moves forward through sample().
///
/// All methods may be called from any thread. Parameter changes and sampling
/// are serialized by a spin lock, so a change lands between two samples and
/// never inside one.
class Envelope {
public:
    static constexpr double kMinOvershoot = 1e-9;
    static constexpr double kMaxOvershoot = 1e9;

    Envelope();
    explicit Envelope(const EnvelopeParameters& params);

    Envelope(const Envelope&) = delete;
    Envelope& operator=(const Envelope&) = delete;

    // Validates every field before touching any. A loop envelope restarts in
    // the attacking stage.
    bool configure(const EnvelopeParameters& params, std::string& error);
    EnvelopeParameters getParameters() const;

    // --- Parameters (return false and keep the old value when invalid) ---
    bool setAttack(double seconds);
    bool setDecay(double seconds);
    bool setSustain(double level);
    bool setRelease(double seconds);
    bool setSampleInterval(double seconds);
    bool setOvershoot(double overshoot);
    void setRetrigger(bool retrigger);
    void setLoop(bool loop);

    double getAttack() const;
    double getDecay() const;
    double getSustain() const;
    double getRelease() const;
    double getSampleInterval() const;
    double getOvershoot() const;
    bool getRetrigger() const;
    bool getLoop() const;

    // --- State ---
    void gate(bool on);
    void sample(float* dest, int numSamples);
    double sampleOne();

    bool setValue(double value);
    double getValue() const;
    EnvelopeStage getStage() const;
    bool isActive() const { return getStage() != EnvelopeStage::off; }

    // Back to off at zero (attacking if looping).
    void reset();

private:
    static double coefficient(double stageTime, double sampleInterval, double overshoot);
    static bool validate(const EnvelopeParameters& params, std::string& error);

    void recompute();
    double advance();

    mutable juce::SpinLock lock_;
    EnvelopeParameters params_;

    EnvelopeStage stage_ = EnvelopeStage::off;
    double value_ = 0.0;

    double attackCoef_ = 0.0;
    double attackBase_ = 0.0;
    double decayCoef_ = 0.0;
    double decayBase_ = 0.0;
    double releaseCoef_ = 0.0;
    double releaseBase_ = 0.0;
};

} // namespace klang
