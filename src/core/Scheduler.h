#pragma once

#include <string>
#include <vector>

namespace klang {

class Block;
class Patch;
class Port;

// A value connection the schedule cannot satisfy within one cycle. The
// consumer reads the producer's output from the previous cycle instead.
struct FeedbackEdge {
    Block* producer;
    Port* source;   // value output of the producer
    Port* dest;     // value input of the consumer
};

struct ExecutionOrder {
    std::vector<Block*> blocks;
    std::vector<FeedbackEdge> feedbackEdges;
};

/// Orders discovered blocks so every producer of a value runs before its
/// consumers. Message connections impose no order. Cycles are broken at
/// back-edges found by a depth-first walk rooted in discovery order, and the
/// remaining graph is emitted in depth-first post-order, again preferring
/// discovery order. The result depends only on the structure, never on
/// addresses, so an unchanged patch yields the same order every time.
class Scheduler {
public:
    static bool order(const Patch& patch, const std::vector<Block*>& blocks,
                      ExecutionOrder& result, std::string& error);
};

} // namespace klang
