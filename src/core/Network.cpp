#include "core/Network.h"
#include "core/Block.h"
#include "core/Logger.h"
#include "core/Patch.h"

#include <deque>
#include <unordered_set>

namespace klang {

std::vector<Block*> Network::discover(const Patch& patch, const std::vector<Block*>& seeds)
{
    std::vector<Block*> found;
    std::unordered_set<int> visited;
    std::deque<Block*> frontier;

    auto visit = [&](int handle) {
        Block* block = patch.getBlock(handle);
        if (!block || !visited.insert(handle).second)
            return;
        found.push_back(block);
        frontier.push_back(block);
    };

    for (Block* seed : seeds)
    {
        if (!seed || patch.getBlock(seed->getHandle()) != seed)
        {
            KL_WARN("discover: seed %s is not part of this patch",
                    seed ? seed->describe().c_str() : "(null)");
            continue;
        }
        visit(seed->getHandle());
    }

    while (!frontier.empty())
    {
        Block* block = frontier.front();
        frontier.pop_front();

        // Outputs' targets
        for (int i = 0; i < block->getNumOutputs(); ++i)
            for (const auto& conn : patch.getConnectionsFrom(block->getOutput(i)->getAddress()))
                visit(conn.dest.blockHandle);

        // Inputs' sources
        for (int i = 0; i < block->getNumInputs(); ++i)
            if (const Connection* conn = patch.findConnectionTo(block->getInput(i)->getAddress()))
                visit(conn->source.blockHandle);

        // Relays are wired on both faces: input relays feed children, output
        // relays are fed by them.
        for (int i = 0; i < block->getNumInputs(); ++i)
        {
            const Port* port = block->getInput(i);
            if (!isRelay(port->getKind())) continue;
            for (const auto& conn : patch.getConnectionsFrom(port->getAddress()))
                visit(conn.dest.blockHandle);
        }
        for (int i = 0; i < block->getNumOutputs(); ++i)
        {
            const Port* port = block->getOutput(i);
            if (!isRelay(port->getKind())) continue;
            if (const Connection* conn = patch.findConnectionTo(port->getAddress()))
                visit(conn->source.blockHandle);
        }

        for (int child : block->getChildren())
            visit(child);
    }

    KL_DEBUG("discover: %d seeds -> %d blocks",
             static_cast<int>(seeds.size()), static_cast<int>(found.size()));
    return found;
}

} // namespace klang
