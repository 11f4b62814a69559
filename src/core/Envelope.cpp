#include "core/Envelope.h"
#include "core/Logger.h"

#include <cmath>

namespace klang {

namespace {

constexpr double kUpper = 1.0;
constexpr double kLower = 0.0;

using Lock = juce::SpinLock::ScopedLockType;

} // namespace

const char* envelopeStageName(EnvelopeStage stage)
{
    switch (stage)
    {
        case EnvelopeStage::off:        return "off";
        case EnvelopeStage::attacking:  return "attacking";
        case EnvelopeStage::decaying:   return "decaying";
        case EnvelopeStage::sustaining: return "sustaining";
        case EnvelopeStage::releasing:  return "releasing";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════
// Construction / configuration
// ═══════════════════════════════════════════════════════════════════

Envelope::Envelope()
    : Envelope(EnvelopeParameters{})
{
}

Envelope::Envelope(const EnvelopeParameters& params)
{
    std::string error;
    if (!configure(params, error))
    {
        KL_WARN("Envelope: %s, using defaults", error.c_str());
        configure(EnvelopeParameters{}, error);
    }
}

bool Envelope::validate(const EnvelopeParameters& params, std::string& error)
{
    if (!(params.attack >= 0.0 && params.decay >= 0.0 && params.release >= 0.0))
    {
        error = "envelope times must be non-negative numbers";
        return false;
    }
    if (params.sustain < 0.0 || params.sustain > 1.0)
    {
        error = "sustain must lie in [0, 1]";
        return false;
    }
    if (!(params.sampleInterval > 0.0))
    {
        error = "sample interval must be positive";
        return false;
    }
    if (params.overshoot < 0.0 || std::isnan(params.overshoot))
    {
        error = "overshoot must not be negative";
        return false;
    }
    return true;
}

bool Envelope::configure(const EnvelopeParameters& params, std::string& error)
{
    if (!validate(params, error))
    {
        KL_WARN("Envelope::configure: %s", error.c_str());
        return false;
    }

    const Lock sl(lock_);
    params_ = params;
    params_.overshoot = juce::jlimit(kMinOvershoot, kMaxOvershoot, params.overshoot);
    recompute();
    if (params_.loop)
        stage_ = EnvelopeStage::attacking;
    return true;
}

EnvelopeParameters Envelope::getParameters() const
{
    const Lock sl(lock_);
    return params_;
}

double Envelope::coefficient(double stageTime, double sampleInterval, double overshoot)
{
    double rate = stageTime / sampleInterval;
    if (rate <= 0.0)
        return 0.0;
    return std::exp(-std::log((1.0 + overshoot) / overshoot) / rate);
}

void Envelope::recompute()
{
    const double dt = params_.sampleInterval;
    const double o = params_.overshoot;

    attackCoef_ = coefficient(params_.attack, dt, o);
    attackBase_ = (kUpper + o) * (1.0 - attackCoef_);
    decayCoef_ = coefficient(params_.decay, dt, o);
    decayBase_ = (params_.sustain - o) * (1.0 - decayCoef_);
    releaseCoef_ = coefficient(params_.release, dt, o);
    releaseBase_ = (kLower - o) * (1.0 - releaseCoef_);
}

// ═══════════════════════════════════════════════════════════════════
// Parameters
// ═══════════════════════════════════════════════════════════════════

bool Envelope::setAttack(double seconds)
{
    if (!(seconds >= 0.0))
    {
        KL_WARN("Envelope::setAttack: %f is not a non-negative time", seconds);
        return false;
    }
    const Lock sl(lock_);
    params_.attack = seconds;
    recompute();
    return true;
}

bool Envelope::setDecay(double seconds)
{
    if (!(seconds >= 0.0))
    {
        KL_WARN("Envelope::setDecay: %f is not a non-negative time", seconds);
        return false;
    }
    const Lock sl(lock_);
    params_.decay = seconds;
    recompute();
    return true;
}

bool Envelope::setSustain(double level)
{
    if (!(level >= 0.0 && level <= 1.0))
    {
        KL_WARN("Envelope::setSustain: %f outside [0, 1]", level);
        return false;
    }
    const Lock sl(lock_);
    params_.sustain = level;
    recompute();
    return true;
}

bool Envelope::setRelease(double seconds)
{
    if (!(seconds >= 0.0))
    {
        KL_WARN("Envelope::setRelease: %f is not a non-negative time", seconds);
        return false;
    }
    const Lock sl(lock_);
    params_.release = seconds;
    recompute();
    return true;
}

bool Envelope::setSampleInterval(double seconds)
{
    if (!(seconds > 0.0))
    {
        KL_WARN("Envelope::setSampleInterval: %f is not positive", seconds);
        return false;
    }
    const Lock sl(lock_);
    params_.sampleInterval = seconds;
    recompute();
    return true;
}

bool Envelope::setOvershoot(double overshoot)
{
    if (overshoot < 0.0 || std::isnan(overshoot))
    {
        KL_WARN("Envelope::setOvershoot: %f is negative", overshoot);
        return false;
    }
    const Lock sl(lock_);
    params_.overshoot = juce::jlimit(kMinOvershoot, kMaxOvershoot, overshoot);
    recompute();
    return true;
}

void Envelope::setRetrigger(bool retrigger)
{
    const Lock sl(lock_);
    params_.retrigger = retrigger;
}

void Envelope::setLoop(bool loop)
{
    const Lock sl(lock_);
    params_.loop = loop;
}

double Envelope::getAttack() const         { const Lock sl(lock_); return params_.attack; }
double Envelope::getDecay() const          { const Lock sl(lock_); return params_.decay; }
double Envelope::getSustain() const        { const Lock sl(lock_); return params_.sustain; }
double Envelope::getRelease() const        { const Lock sl(lock_); return params_.release; }
double Envelope::getSampleInterval() const { const Lock sl(lock_); return params_.sampleInterval; }
double Envelope::getOvershoot() const      { const Lock sl(lock_); return params_.overshoot; }
bool Envelope::getRetrigger() const        { const Lock sl(lock_); return params_.retrigger; }
bool Envelope::getLoop() const             { const Lock sl(lock_); return params_.loop; }

// ═══════════════════════════════════════════════════════════════════
// State machine
// ═══════════════════════════════════════════════════════════════════

void Envelope::gate(bool on)
{
    const Lock sl(lock_);
    if (params_.loop)
        return;

    if (on)
    {
        if (params_.retrigger || stage_ == EnvelopeStage::off
            || stage_ == EnvelopeStage::releasing)
            stage_ = EnvelopeStage::attacking;
    }
    else if (stage_ == EnvelopeStage::attacking || stage_ == EnvelopeStage::decaying
             || stage_ == EnvelopeStage::sustaining)
    {
        stage_ = EnvelopeStage::releasing;
    }
}

double Envelope::advance()
{
    double next = kLower;
    switch (stage_)
    {
        case EnvelopeStage::off:
            next = kLower;
            if (params_.loop)
                stage_ = EnvelopeStage::attacking;
            break;

        case EnvelopeStage::attacking:
            next = attackBase_ + value_ * attackCoef_;
            if (next >= kUpper)
            {
                next = kUpper;
                stage_ = EnvelopeStage::decaying;
            }
            break;

        case EnvelopeStage::decaying:
            next = decayBase_ + value_ * decayCoef_;
            if (next <= params_.sustain)
            {
                next = params_.sustain;
                stage_ = EnvelopeStage::sustaining;
            }
            break;

        case EnvelopeStage::sustaining:
            next = params_.sustain;
            if (params_.loop)
                stage_ = EnvelopeStage::releasing;
            break;

        case EnvelopeStage::releasing:
            next = releaseBase_ + value_ * releaseCoef_;
            if (next <= kLower)
            {
                next = kLower;
                stage_ = params_.loop ? EnvelopeStage::attacking : EnvelopeStage::off;
            }
            break;
    }

    value_ = next;
    return next;
}

void Envelope::sample(float* dest, int numSamples)
{
    const Lock sl(lock_);
    for (int i = 0; i < numSamples; ++i)
        dest[i] = static_cast<float>(advance());
}

double Envelope::sampleOne()
{
    const Lock sl(lock_);
    return advance();
}

bool Envelope::setValue(double value)
{
    if (!(value >= kLower && value <= kUpper))
    {
        KL_WARN("Envelope::setValue: %f outside [0, 1]", value);
        return false;
    }
    const Lock sl(lock_);
    value_ = value;
    return true;
}

double Envelope::getValue() const
{
    const Lock sl(lock_);
    return value_;
}

EnvelopeStage Envelope::getStage() const
{
    const Lock sl(lock_);
    return stage_;
}

void Envelope::reset()
{
    const Lock sl(lock_);
    value_ = kLower;
    stage_ = params_.loop ? EnvelopeStage::attacking : EnvelopeStage::off;
}

} // namespace klang
