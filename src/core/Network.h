#pragma once

#include <vector>

namespace klang {

class Block;
class Patch;

/// Reachability over a patch's connections.
class Network {
public:
    // Breadth-first walk from the seeds across every connection in both
    // directions and into composite children. Blocks come back in discovery
    // order, each once. Seeds not owned by the patch are skipped.
    static std::vector<Block*> discover(const Patch& patch, const std::vector<Block*>& seeds);
};

} // namespace klang
