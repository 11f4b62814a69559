#pragma once

#include "core/Block.h"
#include "core/Port.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace klang {

class Mixer;

struct Connection {
    int id;
    PortAddress source;
    PortAddress dest;
};

/// Owns blocks and the connections between their ports.
///
/// Mutators take the patch lock, which the engine also holds for the length
/// of every cycle, so the structure can be edited while a run is in progress.
/// The lock is reentrant: composite operations such as mix() nest block-level
/// changes under it. Each structural change bumps the version; the engine
/// notices and rebuilds its schedule at the next cycle boundary. Const queries
/// do not lock: call them from the control thread or with getLock() held.
class Patch {
public:
    Patch();
    ~Patch();

    // Non-copyable, non-movable
    Patch(const Patch&) = delete;
    Patch& operator=(const Patch&) = delete;
    Patch(Patch&&) = delete;
    Patch& operator=(Patch&&) = delete;

    // --- Block management ---
    template<typename T>
    T* addBlock(std::unique_ptr<T> block)
    {
        T* raw = block.get();
        return adoptBlock(std::unique_ptr<Block>(std::move(block))) ? raw : nullptr;
    }

    bool removeBlock(int handle);
    Block* getBlock(int handle) const;
    int getBlockCount() const { return static_cast<int>(blocks_.size()); }
    std::vector<Block*> getBlocks() const;

    // --- Connection management ---
    int connect(Port& source, Port& dest, std::string& error);
    bool disconnect(Port& source, Port& dest);
    bool disconnect(int connectionId);

    // Connects left's primary output to right's primary input. Returns right.
    Block* chain(Block& left, Block& right, std::string& error);

    // Fans right's primary output into a mixer. Extends left when it already
    // is a Mixer, otherwise creates one fed by both operands.
    Mixer* mix(Block& left, Block& right, std::string& error);

    // --- Queries ---
    std::vector<Connection> getConnections() const { return connections_; }
    std::vector<Connection> getConnectionsForBlock(int handle) const;
    std::vector<Connection> getConnectionsFrom(const PortAddress& source) const;
    const Connection* findConnectionTo(const PortAddress& dest) const;
    Port* getPort(const PortAddress& address) const;

    // Follows relays upstream to the output that feeds this input, or nullptr.
    Port* resolveSource(const Port& input) const;
    // Follows relays downstream to every terminal input fed by this output.
    std::vector<Port*> resolveTargets(const Port& output) const;

    // Points every value input at the buffer of its resolved source, or at its
    // own default.
    void refreshBindings();

    // --- Synchronisation ---
    juce::CriticalSection& getLock() const { return lock_; }
    uint64_t getVersion() const { return version_.load(std::memory_order_acquire); }
    void markChanged() { version_.fetch_add(1, std::memory_order_acq_rel); }

private:
    bool adoptBlock(std::unique_ptr<Block> block);
    bool owns(const Port& port) const;

    std::map<int, std::unique_ptr<Block>> blocks_;
    std::vector<Connection> connections_;
    int nextHandle_ = 0;
    int nextConnectionId_ = 0;

    mutable juce::CriticalSection lock_;
    std::atomic<uint64_t> version_{0};
};

} // namespace klang
