#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/Constant.h"
#include "core/Delay.h"
#include "core/Patch.h"

using namespace klang;
using Catch::Approx;

TEST_CASE("Delay create validates length, time and dry/wet")
{
    std::string error;
    CHECK(Delay::create(0, 0.5f, 0.5f, error) == nullptr);
    CHECK(Delay::create(Delay::kMaxLength + 1, 0.5f, 0.5f, error) == nullptr);
    CHECK(Delay::create(100, 0.5f, 1.5f, error) == nullptr);
    CHECK(Delay::create(0.0, 44100.0, 0.5f, 0.5f, error) == nullptr);
    CHECK(Delay::create(Delay::kMaxTime * 2, 44100.0, 0.5f, 0.5f, error) == nullptr);
    CHECK_FALSE(error.empty());

    auto delay = Delay::create(0.5, 1000.0, 0.25f, 0.75f, error);
    REQUIRE(delay != nullptr);
    CHECK(delay->getLength() == 500);
    CHECK(delay->getFeedback() == Approx(0.25f));
    CHECK(delay->getDryWet() == Approx(0.75f));
}

TEST_CASE("setDryWet keeps the old value when out of range")
{
    std::string error;
    auto delay = Delay::create(10, 0.0f, 0.5f, error);
    REQUIRE(delay != nullptr);
    CHECK_FALSE(delay->setDryWet(-0.1f));
    CHECK_FALSE(delay->setDryWet(1.1f));
    CHECK(delay->getDryWet() == Approx(0.5f));
    CHECK(delay->setDryWet(1.0f));
    CHECK(delay->getDryWet() == 1.0f);
}

TEST_CASE("Delay blends dry input with fed-back delayed signal")
{
    Patch patch;
    std::string error;
    auto* source = patch.addBlock(std::make_unique<Constant>(1.0f));
    auto* delay = patch.addBlock(Delay::create(2, 0.5f, 0.5f, error));
    REQUIRE(delay != nullptr);
    REQUIRE(patch.chain(*source, *delay, error) == delay);

    source->prepare(44100.0, 6);
    delay->prepare(44100.0, 6);
    source->update();
    delay->update();

    // Delay line holds 1, 1, then 1 + 0.5 * 1 once the first values return.
    const auto& out = delay->output()->getBuffer();
    CHECK(out.getSample(0, 0) == Approx(0.5f));
    CHECK(out.getSample(0, 1) == Approx(0.5f));
    CHECK(out.getSample(0, 2) == Approx(1.0f));
    CHECK(out.getSample(0, 3) == Approx(1.0f));
    CHECK(out.getSample(0, 4) == Approx(1.25f));
    CHECK(out.getSample(0, 5) == Approx(1.25f));
}

TEST_CASE("Fully dry delay passes its input through")
{
    Patch patch;
    std::string error;
    auto* source = patch.addBlock(std::make_unique<Constant>(0.3f));
    auto* delay = patch.addBlock(Delay::create(4, 0.9f, 0.0f, error));
    REQUIRE(delay != nullptr);
    patch.chain(*source, *delay, error);

    source->prepare(44100.0, 8);
    delay->prepare(44100.0, 8);
    source->update();
    delay->update();
    for (int i = 0; i < 8; ++i)
        CHECK(delay->output()->getBuffer().getSample(0, i) == Approx(0.3f));
}
