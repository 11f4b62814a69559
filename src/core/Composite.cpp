#include "core/Composite.h"
#include "core/Logger.h"
#include "core/Patch.h"

#include <algorithm>

namespace klang {

Composite::Composite(const std::string& name)
    : Block(name)
{
}

Port& Composite::addRelayInput(const std::string& name, bool message)
{
    return addInput(name, message ? PortKind::messageRelay : PortKind::valueRelay);
}

Port& Composite::addRelayOutput(const std::string& name, bool message)
{
    return addOutput(name, message ? PortKind::messageRelay : PortKind::valueRelay);
}

bool Composite::adopt(Block& child, std::string& error)
{
    Patch* patch = getPatch();
    if (!patch || child.getPatch() != patch)
    {
        error = "composite '" + getName() + "' and child '" + child.getName()
              + "' must belong to the same patch";
        KL_WARN("adopt failed: %s", error.c_str());
        return false;
    }
    if (&child == this)
    {
        error = "composite '" + getName() + "' cannot adopt itself";
        KL_WARN("adopt failed: %s", error.c_str());
        return false;
    }

    const juce::ScopedLock sl(patch->getLock());
    if (hasChild(child.getHandle()))
        return true;

    children_.push_back(child.getHandle());
    patch->markChanged();
    KL_DEBUG("adopt: %s <- %s", describe().c_str(), child.describe().c_str());
    return true;
}

bool Composite::hasChild(int handle) const
{
    return std::find(children_.begin(), children_.end(), handle) != children_.end();
}

} // namespace klang
