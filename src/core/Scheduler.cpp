#include "core/Scheduler.h"
#include "core/Block.h"
#include "core/Logger.h"
#include "core/Patch.h"

#include <algorithm>
#include <unordered_map>

namespace klang {

namespace {

struct Edge {
    int producer;
    int consumer;
    Port* source;
    Port* dest;
    bool feedback = false;
};

enum class Mark { white, gray, black };

// Dependency graph over discovery indices.
struct DependencyGraph {
    std::vector<Edge> edges;
    std::vector<std::vector<int>> outgoing;   // edge indices by producer
    std::vector<std::vector<int>> incoming;   // edge indices by consumer

    void markBackEdges(int node, std::vector<Mark>& marks)
    {
        marks[static_cast<size_t>(node)] = Mark::gray;
        for (int e : outgoing[static_cast<size_t>(node)])
        {
            Edge& edge = edges[static_cast<size_t>(e)];
            Mark& next = marks[static_cast<size_t>(edge.consumer)];
            if (next == Mark::gray)
                edge.feedback = true;
            else if (next == Mark::white)
                markBackEdges(edge.consumer, marks);
        }
        marks[static_cast<size_t>(node)] = Mark::black;
    }

    void emitPostOrder(int node, std::vector<bool>& placed, std::vector<int>& out) const
    {
        placed[static_cast<size_t>(node)] = true;

        std::vector<int> producers;
        for (int e : incoming[static_cast<size_t>(node)])
        {
            const Edge& edge = edges[static_cast<size_t>(e)];
            if (!edge.feedback)
                producers.push_back(edge.producer);
        }
        std::sort(producers.begin(), producers.end());

        for (int p : producers)
            if (!placed[static_cast<size_t>(p)])
                emitPostOrder(p, placed, out);

        out.push_back(node);
    }
};

} // namespace

bool Scheduler::order(const Patch& patch, const std::vector<Block*>& blocks,
                      ExecutionOrder& result, std::string& error)
{
    const int n = static_cast<int>(blocks.size());
    std::unordered_map<const Block*, int> indexOf;
    for (int i = 0; i < n; ++i)
        indexOf[blocks[static_cast<size_t>(i)]] = i;

    DependencyGraph graph;
    graph.outgoing.resize(static_cast<size_t>(n));
    graph.incoming.resize(static_cast<size_t>(n));

    // Edges in consumer discovery order, then input order.
    for (int consumer = 0; consumer < n; ++consumer)
    {
        Block* block = blocks[static_cast<size_t>(consumer)];
        for (int i = 0; i < block->getNumInputs(); ++i)
        {
            Port* input = block->getInput(i);
            if (input->getKind() != PortKind::valueInput)
                continue;
            Port* source = patch.resolveSource(*input);
            if (!source || source->getKind() != PortKind::valueOutput)
                continue;
            auto it = indexOf.find(&source->getOwner());
            if (it == indexOf.end())
            {
                KL_WARN("Scheduler: %s reads from %s outside the network",
                        block->describe().c_str(), source->getOwner().describe().c_str());
                continue;
            }
            int e = static_cast<int>(graph.edges.size());
            graph.edges.push_back({it->second, consumer, source, input});
            graph.outgoing[static_cast<size_t>(it->second)].push_back(e);
            graph.incoming[static_cast<size_t>(consumer)].push_back(e);
        }
    }

    // Pass 1: classify back-edges
    std::vector<Mark> marks(static_cast<size_t>(n), Mark::white);
    for (int root = 0; root < n; ++root)
        if (marks[static_cast<size_t>(root)] == Mark::white)
            graph.markBackEdges(root, marks);

    // Pass 2: post-order over the remaining DAG
    std::vector<bool> placed(static_cast<size_t>(n), false);
    std::vector<int> sequence;
    sequence.reserve(static_cast<size_t>(n));
    for (int root = 0; root < n; ++root)
        if (!placed[static_cast<size_t>(root)])
            graph.emitPostOrder(root, placed, sequence);

    // Verify: every block exactly once, every forward edge satisfied.
    std::vector<int> position(static_cast<size_t>(n), -1);
    for (int i = 0; i < static_cast<int>(sequence.size()); ++i)
    {
        int& slot = position[static_cast<size_t>(sequence[static_cast<size_t>(i)])];
        if (slot >= 0)
        {
            error = "scheduler placed a block twice";
            jassertfalse;
            return false;
        }
        slot = i;
    }
    for (const auto& edge : graph.edges)
    {
        int from = position[static_cast<size_t>(edge.producer)];
        int to = position[static_cast<size_t>(edge.consumer)];
        if (from < 0 || to < 0 || (!edge.feedback && from >= to))
        {
            error = "scheduler produced an order violating a value dependency";
            jassertfalse;
            return false;
        }
    }

    result.blocks.clear();
    result.feedbackEdges.clear();
    for (int index : sequence)
        result.blocks.push_back(blocks[static_cast<size_t>(index)]);
    for (const auto& edge : graph.edges)
    {
        if (!edge.feedback) continue;
        result.feedbackEdges.push_back({blocks[static_cast<size_t>(edge.producer)],
                                        edge.source, edge.dest});
        KL_DEBUG("Scheduler: feedback %s -> %s",
                 blocks[static_cast<size_t>(edge.producer)]->describe().c_str(),
                 blocks[static_cast<size_t>(edge.consumer)]->describe().c_str());
    }

    KL_DEBUG("Scheduler: %d blocks, %d edges, %d feedback", n,
             static_cast<int>(graph.edges.size()),
             static_cast<int>(result.feedbackEdges.size()));
    return true;
}

} // namespace klang
