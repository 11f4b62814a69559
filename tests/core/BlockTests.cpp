#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/Constant.h"
#include "core/Dac.h"
#include "core/Gain.h"
#include "core/Oscillator.h"
#include "core/Patch.h"

#include <cmath>

using namespace klang;
using Catch::Approx;

// ═══════════════════════════════════════════════════════════════════
// Local test block
// ═══════════════════════════════════════════════════════════════════

class GrowingBlock : public Block {
public:
    GrowingBlock() : Block("Growing")
    {
        addInput("first");
        addOutput("out");
    }

    Port& grow(const std::string& name) { return addInput(name); }

    void prepare(double sampleRate, int blockSize) override
    {
        Block::prepare(sampleRate, blockSize);
        ++prepareCount;
    }

    void update() override { ++updateCount; }

    int prepareCount = 0;
    int updateCount = 0;
};

// ═══════════════════════════════════════════════════════════════════
// Ports and identity
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Block exposes primary ports and lookups by name")
{
    GrowingBlock block;
    REQUIRE(block.getNumInputs() == 1);
    REQUIRE(block.getNumOutputs() == 1);
    CHECK(block.input() == block.getInput(0));
    CHECK(block.output() == block.getOutput(0));
    CHECK(block.findInput("first") == block.input());
    CHECK(block.findInput("missing") == nullptr);
    CHECK(block.getInput(1) == nullptr);
    CHECK(block.getOutput(-1) == nullptr);
}

TEST_CASE("Block without outputs has no primary output")
{
    Dac dac;
    CHECK(dac.output() == nullptr);
    CHECK(dac.input() != nullptr);
}

TEST_CASE("Detached block has no handle and no patch")
{
    GrowingBlock block;
    CHECK(block.getHandle() == -1);
    CHECK(block.getPatch() == nullptr);
    CHECK_FALSE(block.isComposite());
    CHECK(block.getChildren().empty());
    CHECK(block.describe() == "Growing(1 in, 1 out)");
}

TEST_CASE("Adding a port to an attached block bumps the patch version")
{
    Patch patch;
    auto* block = patch.addBlock(std::make_unique<GrowingBlock>());
    block->prepare(44100.0, 16);
    auto before = patch.getVersion();

    Port& port = block->grow("second");
    CHECK(port.getIndex() == 1);
    CHECK(patch.getVersion() > before);
    // Prepared blocks size new ports immediately.
    CHECK(port.getValue().getNumSamples() == 16);
}

// ═══════════════════════════════════════════════════════════════════
// Reference blocks
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Constant fills every channel with its level")
{
    Constant constant(0.5f, 2);
    constant.prepare(44100.0, 8);
    constant.update();

    const auto& out = constant.output()->getBuffer();
    CHECK(out.getNumChannels() == 2);
    for (int ch = 0; ch < 2; ++ch)
        for (int i = 0; i < 8; ++i)
            CHECK(out.getSample(ch, i) == 0.5f);

    constant.setLevel(-1.0f);
    constant.update();
    CHECK(out.getSample(1, 7) == -1.0f);
}

TEST_CASE("Gain multiplies by its default gain")
{
    Patch patch;
    auto* source = patch.addBlock(std::make_unique<Constant>(0.8f));
    auto* gain = patch.addBlock(std::make_unique<Gain>(0.5f));
    std::string error;
    REQUIRE(patch.chain(*source, *gain, error) == gain);

    source->prepare(44100.0, 4);
    gain->prepare(44100.0, 4);
    source->update();
    gain->update();
    CHECK(gain->output()->getBuffer().getSample(0, 3) == Approx(0.4f));

    gain->setGain(0.25f);
    gain->update();
    CHECK(gain->getGain() == 0.25f);
    CHECK(gain->output()->getBuffer().getSample(0, 0) == Approx(0.2f));
}

TEST_CASE("Gain follows a connected gain signal")
{
    Patch patch;
    auto* signal = patch.addBlock(std::make_unique<Constant>(2.0f));
    auto* control = patch.addBlock(std::make_unique<Constant>(-0.5f));
    auto* gain = patch.addBlock(std::make_unique<Gain>());
    std::string error;
    REQUIRE(patch.connect(*signal->output(), *gain->findInput("in"), error) >= 0);
    REQUIRE(patch.connect(*control->output(), *gain->findInput("gain"), error) >= 0);

    for (Block* b : patch.getBlocks())
        b->prepare(44100.0, 2);
    signal->update();
    control->update();
    gain->update();
    CHECK(gain->output()->getBuffer().getSample(0, 1) == Approx(-1.0f));
}

TEST_CASE("Oscillator produces a sine at the concert pitch by default")
{
    Oscillator osc;
    CHECK(osc.getFrequency() == Approx(440.0f));

    const double rate = 44100.0;
    osc.prepare(rate, 64);
    osc.update();

    const auto& out = osc.output()->getBuffer();
    for (int i = 0; i < 64; ++i)
    {
        double expected = std::sin(2.0 * juce::MathConstants<double>::pi * 440.0 * i / rate);
        CHECK(out.getSample(0, i) == Approx(expected).margin(1e-4));
    }
}

TEST_CASE("Oscillator phase is continuous across cycles")
{
    const double rate = 1000.0;
    Oscillator osc(250.0f);   // a quarter turn per sample
    osc.prepare(rate, 3);
    osc.update();
    osc.update();

    // Samples 3, 4, 5 of sin(pi/2 * n): -1, 0, 1
    const auto& out = osc.output()->getBuffer();
    CHECK(out.getSample(0, 0) == Approx(-1.0f).margin(1e-5));
    CHECK(out.getSample(0, 1) == Approx(0.0f).margin(1e-5));
    CHECK(out.getSample(0, 2) == Approx(1.0f).margin(1e-5));
    CHECK(osc.getPhase() >= 0.0);
    CHECK(osc.getPhase() < 1.0);
}

TEST_CASE("Dac collects one channel per input")
{
    Patch patch;
    auto* left = patch.addBlock(std::make_unique<Constant>(0.1f));
    auto* right = patch.addBlock(std::make_unique<Constant>(0.2f));
    auto* dac = patch.addBlock(std::make_unique<Dac>(2));
    std::string error;
    REQUIRE(patch.connect(*left->output(), *dac->getInput(0), error) >= 0);
    REQUIRE(patch.connect(*right->output(), *dac->getInput(1), error) >= 0);

    for (Block* b : patch.getBlocks())
        b->prepare(44100.0, 4);
    left->update();
    right->update();
    dac->update();

    const auto& rendered = dac->getRendered();
    CHECK(dac->getNumChannels() == 2);
    CHECK(rendered.getNumChannels() == 2);
    CHECK(rendered.getSample(0, 3) == 0.1f);
    CHECK(rendered.getSample(1, 3) == 0.2f);
}

TEST_CASE("Re-prepare does not reset block state")
{
    Oscillator osc(100.0f);
    osc.prepare(1000.0, 5);
    osc.update();
    double phase = osc.getPhase();
    osc.prepare(1000.0, 5);
    CHECK(osc.getPhase() == phase);
}

TEST_CASE("Oscillator frequency setter updates the default input")
{
    Patch patch;
    auto* osc = patch.addBlock(std::make_unique<Oscillator>(100.0f));
    osc->prepare(1000.0, 4);
    osc->setFrequency(250.0f);
    CHECK(osc->getFrequency() == 250.0f);
    CHECK(osc->input()->getValue().getSample(0, 3) == 250.0f);
}
