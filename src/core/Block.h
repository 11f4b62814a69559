#pragma once

#include "core/Port.h"

#include <memory>
#include <string>
#include <vector>

namespace klang {

class Patch;

/// Unit of per-cycle computation. Subclasses declare their ports in the
/// constructor and implement update(), which reads input values and writes
/// output buffers once per cycle.
class Block {
public:
    explicit Block(const std::string& name);
    virtual ~Block();

    // Non-copyable, non-movable
    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;

    // --- Lifecycle (control side) ---
    // Sizes port buffers. Must not reset DSP state: it runs again whenever
    // the engine rebuilds its run context.
    virtual void prepare(double sampleRate, int blockSize);
    virtual void release() {}

    // --- Processing (cycle side) ---
    virtual void update() = 0;

    // --- Ports ---
    int getNumInputs() const { return static_cast<int>(inputs_.size()); }
    int getNumOutputs() const { return static_cast<int>(outputs_.size()); }
    Port* getInput(int index) const;
    Port* getOutput(int index) const;
    Port* findInput(const std::string& name) const;
    Port* findOutput(const std::string& name) const;

    // Primary ports, nullptr when the block has none.
    Port* input() const { return getInput(0); }
    Port* output() const { return getOutput(0); }

    // --- Composites ---
    virtual bool isComposite() const { return false; }
    const std::vector<int>& getChildren() const { return children_; }

    // --- Identity ---
    const std::string& getName() const { return name_; }
    int getHandle() const { return handle_; }
    Patch* getPatch() const { return patch_; }
    std::string describe() const;

    double getSampleRate() const { return sampleRate_; }
    int getBlockSize() const { return blockSize_; }

protected:
    Port& addInput(const std::string& name, PortKind kind = PortKind::valueInput,
                   int channels = 1);
    Port& addOutput(const std::string& name, PortKind kind = PortKind::valueOutput,
                    int channels = 1);

    // The owning patch's lock, or a private one while detached.
    juce::CriticalSection& getStructureLock() const;

    std::vector<int> children_;

private:
    friend class Patch;

    Port& addPort(std::vector<std::unique_ptr<Port>>& ports, PortSide side,
                  const std::string& name, PortKind kind, int channels);

    std::string name_;
    int handle_ = -1;
    Patch* patch_ = nullptr;
    double sampleRate_ = 0.0;
    int blockSize_ = 0;

    std::vector<std::unique_ptr<Port>> inputs_;
    std::vector<std::unique_ptr<Port>> outputs_;
};

} // namespace klang
