#include "core/Block.h"
#include "core/Logger.h"
#include "core/Patch.h"

namespace klang {

Block::Block(const std::string& name)
    : name_(name)
{
    KL_TRACE("Block created: name=%s", name_.c_str());
}

Block::~Block()
{
    KL_TRACE("Block destroyed: name=%s handle=%d", name_.c_str(), handle_);
}

void Block::prepare(double sampleRate, int blockSize)
{
    sampleRate_ = sampleRate;
    blockSize_ = blockSize;
    for (auto& port : inputs_)
        port->prepare(blockSize);
    for (auto& port : outputs_)
        port->prepare(blockSize);
}

Port* Block::getInput(int index) const
{
    if (index < 0 || index >= getNumInputs()) return nullptr;
    return inputs_[static_cast<size_t>(index)].get();
}

Port* Block::getOutput(int index) const
{
    if (index < 0 || index >= getNumOutputs()) return nullptr;
    return outputs_[static_cast<size_t>(index)].get();
}

Port* Block::findInput(const std::string& name) const
{
    for (const auto& port : inputs_)
        if (port->getName() == name) return port.get();
    return nullptr;
}

Port* Block::findOutput(const std::string& name) const
{
    for (const auto& port : outputs_)
        if (port->getName() == name) return port.get();
    return nullptr;
}

juce::CriticalSection& Block::getStructureLock() const
{
    static juce::CriticalSection detachedLock;
    return patch_ ? patch_->getLock() : detachedLock;
}

std::string Block::describe() const
{
    std::string text = name_;
    if (handle_ >= 0)
        text += "#" + std::to_string(handle_);
    text += "(" + std::to_string(getNumInputs()) + " in, "
          + std::to_string(getNumOutputs()) + " out)";
    return text;
}

Port& Block::addInput(const std::string& name, PortKind kind, int channels)
{
    jassert(canReceive(kind));
    return addPort(inputs_, PortSide::input, name, kind, channels);
}

Port& Block::addOutput(const std::string& name, PortKind kind, int channels)
{
    jassert(canSend(kind));
    return addPort(outputs_, PortSide::output, name, kind, channels);
}

Port& Block::addPort(std::vector<std::unique_ptr<Port>>& ports, PortSide side,
                     const std::string& name, PortKind kind, int channels)
{
    // Ports added after the block joined a patch change the structure the
    // engine scheduled; serialize with running cycles.
    const juce::ScopedLock sl(getStructureLock());

    int index = static_cast<int>(ports.size());
    ports.push_back(std::make_unique<Port>(*this, side, index, name, kind, channels));
    Port& port = *ports.back();
    if (blockSize_ > 0)
        port.prepare(blockSize_);

    if (patch_)
    {
        patch_->markChanged();
        KL_DEBUG("Block::addPort: %s.%s (%s) index=%d", name_.c_str(), name.c_str(),
                 portKindName(kind), index);
    }
    return port;
}

} // namespace klang
