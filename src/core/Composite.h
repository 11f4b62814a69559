#pragma once

#include "core/Block.h"

#include <string>

namespace klang {

/// Block that groups an internal sub-network behind relay ports.
///
/// Relay inputs are wired from outside to the composite and from the
/// composite to child inputs; relay outputs the other way round. Children are
/// ordinary blocks of the same patch and are scheduled individually, so
/// update() does nothing here.
class Composite : public Block {
public:
    explicit Composite(const std::string& name);

    bool isComposite() const override { return true; }
    void update() override {}

    Port& addRelayInput(const std::string& name, bool message = false);
    Port& addRelayOutput(const std::string& name, bool message = false);

    // Registers a block of the same patch as a child.
    bool adopt(Block& child, std::string& error);
    bool hasChild(int handle) const;
};

} // namespace klang
