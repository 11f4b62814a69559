#include <catch2/catch_test_macros.hpp>
#include "core/Composite.h"
#include "core/Constant.h"
#include "core/Gain.h"
#include "core/Network.h"
#include "core/Patch.h"

#include <algorithm>

using namespace klang;

static bool contains(const std::vector<Block*>& blocks, const Block* block)
{
    return std::find(blocks.begin(), blocks.end(), block) != blocks.end();
}

TEST_CASE("Composite ports are relays")
{
    Composite box("Box");
    Port& in = box.addRelayInput("in");
    Port& trig = box.addRelayInput("trigger", true);
    Port& out = box.addRelayOutput("out");

    CHECK(box.isComposite());
    CHECK(in.getKind() == PortKind::valueRelay);
    CHECK(trig.getKind() == PortKind::messageRelay);
    CHECK(out.getKind() == PortKind::valueRelay);
    CHECK(box.input() == &in);
    CHECK(box.output() == &out);
}

TEST_CASE("adopt registers children of the same patch once")
{
    Patch patch;
    auto* box = patch.addBlock(std::make_unique<Composite>("Box"));
    auto* child = patch.addBlock(std::make_unique<Gain>());
    std::string error;

    auto version = patch.getVersion();
    REQUIRE(box->adopt(*child, error));
    CHECK(box->hasChild(child->getHandle()));
    CHECK(patch.getVersion() > version);

    REQUIRE(box->adopt(*child, error));
    CHECK(box->getChildren().size() == 1);
}

TEST_CASE("adopt rejects blocks outside the patch and itself")
{
    Patch patch;
    Patch other;
    auto* box = patch.addBlock(std::make_unique<Composite>("Box"));
    auto* stranger = other.addBlock(std::make_unique<Gain>());
    std::string error;

    CHECK_FALSE(box->adopt(*stranger, error));
    CHECK_FALSE(error.empty());
    CHECK_FALSE(box->adopt(*box, error));
    CHECK(box->getChildren().empty());

    Composite detached("Detached");
    Gain gain;
    CHECK_FALSE(detached.adopt(gain, error));
}

TEST_CASE("Removing a child drops it from its composite")
{
    Patch patch;
    auto* box = patch.addBlock(std::make_unique<Composite>("Box"));
    auto* child = patch.addBlock(std::make_unique<Gain>());
    std::string error;
    REQUIRE(box->adopt(*child, error));

    REQUIRE(patch.removeBlock(child->getHandle()));
    CHECK(box->getChildren().empty());
}

TEST_CASE("Discovery unwraps composite children even when unconnected")
{
    Patch patch;
    auto* box = patch.addBlock(std::make_unique<Composite>("Box"));
    auto* child = patch.addBlock(std::make_unique<Constant>());
    auto* grandchildBox = patch.addBlock(std::make_unique<Composite>("Inner"));
    auto* grandchild = patch.addBlock(std::make_unique<Gain>());
    std::string error;
    REQUIRE(box->adopt(*child, error));
    REQUIRE(box->adopt(*grandchildBox, error));
    REQUIRE(grandchildBox->adopt(*grandchild, error));

    auto found = Network::discover(patch, {box});
    CHECK(found.size() == 4);
    CHECK(found.front() == box);
    CHECK(contains(found, child));
    CHECK(contains(found, grandchild));
}

TEST_CASE("Seeding an inner block reaches the outside through relays")
{
    Patch patch;
    auto* source = patch.addBlock(std::make_unique<Constant>());
    auto* box = patch.addBlock(std::make_unique<Composite>("Box"));
    auto* inner = patch.addBlock(std::make_unique<Gain>());
    Port& boxIn = box->addRelayInput("in");
    std::string error;
    REQUIRE(patch.connect(*source->output(), boxIn, error) >= 0);
    REQUIRE(patch.connect(boxIn, *inner->input(), error) >= 0);

    auto found = Network::discover(patch, {inner});
    CHECK(found.size() == 3);
    CHECK(contains(found, box));
    CHECK(contains(found, source));
}
