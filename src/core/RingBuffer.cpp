#include "core/RingBuffer.h"
#include "core/Config.h"
#include "core/Logger.h"

#include <algorithm>

namespace klang {

std::unique_ptr<RingBuffer> RingBuffer::create(int length, std::string& error)
{
    if (length < 1 || length > kMaxRingBufferCapacity)
    {
        error = "ring buffer length " + std::to_string(length) + " outside [1, "
              + std::to_string(kMaxRingBufferCapacity) + "]";
        KL_WARN("RingBuffer::create: %s", error.c_str());
        return nullptr;
    }
    return std::unique_ptr<RingBuffer>(new RingBuffer(length));
}

RingBuffer::RingBuffer(int length)
    : length_(length), data_(static_cast<size_t>(length), 0.0)
{
}

void RingBuffer::clear()
{
    std::fill(data_.begin(), data_.end(), 0.0);
    position_ = 0;
}

} // namespace klang
