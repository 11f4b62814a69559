#include "core/Patch.h"
#include "core/Logger.h"
#include "core/Mixer.h"

#include <algorithm>

namespace klang {

namespace {

// Longest relay chain followed before a resolution gives up. Relays wired
// into a loop would otherwise never reach a terminal port.
constexpr int kMaxRelayDepth = 64;

std::string describePort(const Port& port)
{
    return port.getOwner().getName() + "#" + std::to_string(port.getOwner().getHandle())
         + "." + port.getName();
}

} // namespace

Patch::Patch()
{
    KL_TRACE("Patch created");
}

Patch::~Patch()
{
    KL_TRACE("Patch destroyed: %d blocks, %d connections",
             static_cast<int>(blocks_.size()), static_cast<int>(connections_.size()));
    for (auto& pair : blocks_)
        pair.second->release();
}

// ═══════════════════════════════════════════════════════════════════
// Block management
// ═══════════════════════════════════════════════════════════════════

bool Patch::adoptBlock(std::unique_ptr<Block> block)
{
    if (!block)
    {
        KL_WARN("addBlock: null block");
        return false;
    }

    const juce::ScopedLock sl(lock_);
    int handle = nextHandle_++;
    block->handle_ = handle;
    block->patch_ = this;
    KL_DEBUG("addBlock: %s", block->describe().c_str());
    blocks_[handle] = std::move(block);
    markChanged();
    return true;
}

bool Patch::removeBlock(int handle)
{
    const juce::ScopedLock sl(lock_);
    auto it = blocks_.find(handle);
    if (it == blocks_.end())
    {
        KL_WARN("removeBlock: handle=%d not found", handle);
        return false;
    }
    KL_DEBUG("removeBlock: %s", it->second->describe().c_str());

    // Cascade-remove all connections involving this block
    connections_.erase(
        std::remove_if(connections_.begin(), connections_.end(),
            [handle](const Connection& c) {
                return c.source.blockHandle == handle || c.dest.blockHandle == handle;
            }),
        connections_.end());

    for (auto& pair : blocks_)
    {
        auto& children = pair.second->children_;
        children.erase(std::remove(children.begin(), children.end(), handle), children.end());
    }

    it->second->release();
    blocks_.erase(it);
    refreshBindings();
    markChanged();
    return true;
}

Block* Patch::getBlock(int handle) const
{
    auto it = blocks_.find(handle);
    if (it == blocks_.end()) return nullptr;
    return it->second.get();
}

std::vector<Block*> Patch::getBlocks() const
{
    std::vector<Block*> result;
    result.reserve(blocks_.size());
    for (const auto& pair : blocks_)
        result.push_back(pair.second.get());
    return result;
}

// ═══════════════════════════════════════════════════════════════════
// Connection management
// ═══════════════════════════════════════════════════════════════════

bool Patch::owns(const Port& port) const
{
    return getBlock(port.getOwner().getHandle()) == &port.getOwner();
}

int Patch::connect(Port& source, Port& dest, std::string& error)
{
    const juce::ScopedLock sl(lock_);

    // 1. Both ports belong to blocks of this patch
    if (!owns(source) || !owns(dest))
    {
        error = "ports must belong to blocks of this patch";
        KL_WARN("connect failed: %s", error.c_str());
        return -1;
    }

    KL_DEBUG("connect: %s -> %s", describePort(source).c_str(), describePort(dest).c_str());

    // 2. Not the same port
    if (&source == &dest)
    {
        error = "cannot connect port '" + describePort(source) + "' to itself";
        KL_WARN("connect failed: %s", error.c_str());
        return -1;
    }

    // 3. Kind compatibility
    if (!canConnect(source.getKind(), dest.getKind()))
    {
        error = std::string("incompatible ports: cannot connect ")
              + portKindName(source.getKind()) + " '" + describePort(source) + "' to "
              + portKindName(dest.getKind()) + " '" + describePort(dest) + "'";
        KL_WARN("connect failed: %s", error.c_str());
        return -1;
    }

    // 4. No fan-in: the target must be free
    if (findConnectionTo(dest.getAddress()))
    {
        error = "target occupied: '" + describePort(dest) + "' is already connected";
        KL_WARN("connect failed: %s", error.c_str());
        return -1;
    }

    int connId = nextConnectionId_++;
    connections_.push_back({connId, source.getAddress(), dest.getAddress()});
    refreshBindings();
    markChanged();
    KL_DEBUG("connect: created connection id=%d", connId);
    return connId;
}

bool Patch::disconnect(Port& source, Port& dest)
{
    const juce::ScopedLock sl(lock_);
    auto srcAddr = source.getAddress();
    auto dstAddr = dest.getAddress();
    auto it = std::find_if(connections_.begin(), connections_.end(),
        [&](const Connection& c) { return c.source == srcAddr && c.dest == dstAddr; });

    if (it == connections_.end())
    {
        KL_DEBUG("disconnect: %s -> %s not connected",
                 describePort(source).c_str(), describePort(dest).c_str());
        return false;
    }
    return disconnect(it->id);
}

bool Patch::disconnect(int connectionId)
{
    const juce::ScopedLock sl(lock_);
    auto it = std::find_if(connections_.begin(), connections_.end(),
        [connectionId](const Connection& c) { return c.id == connectionId; });

    if (it == connections_.end())
    {
        KL_DEBUG("disconnect: connection id=%d not found", connectionId);
        return false;
    }

    KL_DEBUG("disconnect: removing connection id=%d (%d:%d -> %d:%d)", connectionId,
             it->source.blockHandle, it->source.index,
             it->dest.blockHandle, it->dest.index);
    connections_.erase(it);
    refreshBindings();
    markChanged();
    return true;
}

Block* Patch::chain(Block& left, Block& right, std::string& error)
{
    Port* out = left.output();
    Port* in = right.input();
    if (!out || !in)
    {
        error = "chain needs a primary output on '" + left.getName()
              + "' and a primary input on '" + right.getName() + "'";
        KL_WARN("chain failed: %s", error.c_str());
        return nullptr;
    }
    if (connect(*out, *in, error) < 0)
        return nullptr;
    return &right;
}

Mixer* Patch::mix(Block& left, Block& right, std::string& error)
{
    const juce::ScopedLock sl(lock_);

    auto* mixer = dynamic_cast<Mixer*>(&left);
    Port* rightOut = right.output();
    Port* leftOut = mixer ? nullptr : left.output();

    // Validate everything up front so a rejection leaves the patch untouched.
    if (getBlock(left.getHandle()) != &left || getBlock(right.getHandle()) != &right)
    {
        error = "mix operands must belong to this patch";
        KL_WARN("mix failed: %s", error.c_str());
        return nullptr;
    }
    if (!rightOut || !isValueKind(rightOut->getKind()) || !canSend(rightOut->getKind()))
    {
        error = "mix needs a value output on '" + right.getName() + "'";
        KL_WARN("mix failed: %s", error.c_str());
        return nullptr;
    }
    if (!mixer && (!leftOut || !isValueKind(leftOut->getKind()) || !canSend(leftOut->getKind())))
    {
        error = "mix needs a value output on '" + left.getName() + "'";
        KL_WARN("mix failed: %s", error.c_str());
        return nullptr;
    }

    if (!mixer)
    {
        mixer = addBlock(std::make_unique<Mixer>());
        int first = mixer->addChannel();
        if (connect(*leftOut, *mixer->getChannel(first), error) < 0)
        {
            removeBlock(mixer->getHandle());
            return nullptr;
        }
    }

    int channel = mixer->addChannel();
    if (connect(*rightOut, *mixer->getChannel(channel), error) < 0)
    {
        KL_WARN("mix failed: %s", error.c_str());
        return nullptr;
    }
    KL_DEBUG("mix: %s now has %d channels", mixer->describe().c_str(), mixer->getNumChannels());
    return mixer;
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

std::vector<Connection> Patch::getConnectionsForBlock(int handle) const
{
    std::vector<Connection> result;
    for (const auto& conn : connections_)
    {
        if (conn.source.blockHandle == handle || conn.dest.blockHandle == handle)
            result.push_back(conn);
    }
    return result;
}

std::vector<Connection> Patch::getConnectionsFrom(const PortAddress& source) const
{
    std::vector<Connection> result;
    for (const auto& conn : connections_)
    {
        if (conn.source == source)
            result.push_back(conn);
    }
    return result;
}

const Connection* Patch::findConnectionTo(const PortAddress& dest) const
{
    for (const auto& conn : connections_)
    {
        if (conn.dest == dest)
            return &conn;
    }
    return nullptr;
}

Port* Patch::getPort(const PortAddress& address) const
{
    Block* block = getBlock(address.blockHandle);
    if (!block) return nullptr;
    return address.side == PortSide::input ? block->getInput(address.index)
                                           : block->getOutput(address.index);
}

Port* Patch::resolveSource(const Port& input) const
{
    PortAddress current = input.getAddress();
    for (int depth = 0; depth < kMaxRelayDepth; ++depth)
    {
        const Connection* conn = findConnectionTo(current);
        if (!conn) return nullptr;
        Port* source = getPort(conn->source);
        if (!source) return nullptr;
        if (!isRelay(source->getKind()))
            return source;
        current = conn->source;
    }
    KL_WARN("resolveSource: relay chain from '%s' too deep", describePort(input).c_str());
    return nullptr;
}

std::vector<Port*> Patch::resolveTargets(const Port& output) const
{
    std::vector<Port*> result;
    std::vector<std::pair<PortAddress, int>> pending{{output.getAddress(), 0}};

    while (!pending.empty())
    {
        auto [address, depth] = pending.back();
        pending.pop_back();
        if (depth >= kMaxRelayDepth)
        {
            KL_WARN("resolveTargets: relay chain from '%s' too deep",
                    describePort(output).c_str());
            continue;
        }

        // Reverse so targets come out in connection order.
        auto conns = getConnectionsFrom(address);
        for (auto it = conns.rbegin(); it != conns.rend(); ++it)
        {
            Port* dest = getPort(it->dest);
            if (!dest) continue;
            if (isRelay(dest->getKind()))
                pending.push_back({it->dest, depth + 1});
            else
                result.push_back(dest);
        }
    }
    return result;
}

void Patch::refreshBindings()
{
    const juce::ScopedLock sl(lock_);
    for (const auto& pair : blocks_)
    {
        Block& block = *pair.second;
        for (int i = 0; i < block.getNumInputs(); ++i)
        {
            Port* input = block.getInput(i);
            if (input->getKind() != PortKind::valueInput)
                continue;
            Port* source = resolveSource(*input);
            if (source && source->getKind() == PortKind::valueOutput)
                input->bind(&source->getBuffer());
            else
                input->bind(nullptr);
        }
    }
}

} // namespace klang
