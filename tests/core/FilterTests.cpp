#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/Constant.h"
#include "core/Patch.h"
#include "core/RingBufferFilter.h"

#include <vector>

using namespace klang;
using Catch::Approx;

static std::vector<float> impulse(int length)
{
    std::vector<float> x(static_cast<size_t>(length), 0.0f);
    x[0] = 1.0f;
    return x;
}

static std::vector<float> run(RingBufferFilter& filter, const std::vector<float>& x)
{
    std::vector<float> y(x.size());
    filter.filter(x.data(), y.data(), static_cast<int>(x.size()));
    return y;
}

TEST_CASE("Filters reject invalid delay lengths")
{
    std::string error;
    CHECK(ForwardCombFilter::create(0, error) == nullptr);
    CHECK_FALSE(error.empty());
    CHECK(BackwardCombFilter::create(-1, 0.5f, error) == nullptr);
    CHECK(EchoFilter::create(kMaxRingBufferCapacity + 1, error) == nullptr);
}

TEST_CASE("Filters default to alpha 0.9")
{
    std::string error;
    auto comb = ForwardCombFilter::create(3, error);
    REQUIRE(comb != nullptr);
    CHECK(comb->getAlpha() == Approx(kDefaultFilterAlpha));
    CHECK(comb->getLength() == 3);
    comb->setAlpha(0.1f);
    CHECK(comb->getAlpha() == Approx(0.1f));
}

TEST_CASE("Forward comb adds one scaled echo of the input")
{
    std::string error;
    auto comb = ForwardCombFilter::create(2, 0.5f, error);
    REQUIRE(comb != nullptr);

    auto y = run(*comb, impulse(7));
    std::vector<float> expected{1.0f, 0.0f, 0.5f, 0.0f, 0.0f, 0.0f, 0.0f};
    for (size_t i = 0; i < y.size(); ++i)
        CHECK(y[i] == Approx(expected[i]));
}

TEST_CASE("Backward comb feeds its output back")
{
    std::string error;
    auto comb = BackwardCombFilter::create(2, 0.5f, error);
    REQUIRE(comb != nullptr);

    auto y = run(*comb, impulse(7));
    std::vector<float> expected{1.0f, 0.0f, 0.5f, 0.0f, 0.25f, 0.0f, 0.125f};
    for (size_t i = 0; i < y.size(); ++i)
        CHECK(y[i] == Approx(expected[i]));
}

TEST_CASE("Echo with zero alpha is a pure delay")
{
    std::string error;
    auto echo = EchoFilter::create(3, 0.0f, error);
    REQUIRE(echo != nullptr);

    std::vector<float> x{1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
    auto y = run(*echo, x);
    CHECK(y[0] == 0.0f);
    CHECK(y[1] == 0.0f);
    CHECK(y[2] == 0.0f);
    CHECK(y[3] == Approx(1.0f));
    CHECK(y[4] == Approx(2.0f));
}

TEST_CASE("Echo repeats with decaying feedback and no dry signal")
{
    std::string error;
    auto echo = EchoFilter::create(2, 0.5f, error);
    REQUIRE(echo != nullptr);

    auto y = run(*echo, impulse(7));
    std::vector<float> expected{0.0f, 0.0f, 1.0f, 0.0f, 0.5f, 0.0f, 0.25f};
    for (size_t i = 0; i < y.size(); ++i)
        CHECK(y[i] == Approx(expected[i]));
}

TEST_CASE("Filter state carries across calls and clear resets it")
{
    std::string error;
    auto comb = ForwardCombFilter::create(2, 1.0f, error);
    REQUIRE(comb != nullptr);

    float x[2] = {1.0f, 2.0f};
    float y[2] = {};
    comb->filter(x, y, 2);
    comb->filter(x, y, 2);
    CHECK(y[0] == Approx(2.0f));
    CHECK(y[1] == Approx(4.0f));

    comb->clear();
    comb->filter(x, y, 2);
    CHECK(y[0] == Approx(1.0f));
    CHECK(y[1] == Approx(2.0f));
}

TEST_CASE("Filter block reads its input port and writes its output port")
{
    Patch patch;
    std::string error;
    auto* source = patch.addBlock(std::make_unique<Constant>(1.0f));
    auto* comb = patch.addBlock(BackwardCombFilter::create(4, 0.5f, error));
    REQUIRE(comb != nullptr);
    REQUIRE(patch.chain(*source, *comb, error) == comb);

    source->prepare(44100.0, 8);
    comb->prepare(44100.0, 8);
    source->update();
    comb->update();

    const auto& out = comb->output()->getBuffer();
    for (int i = 0; i < 4; ++i)
        CHECK(out.getSample(0, i) == Approx(1.0f));
    for (int i = 4; i < 8; ++i)
        CHECK(out.getSample(0, i) == Approx(1.5f));
}
