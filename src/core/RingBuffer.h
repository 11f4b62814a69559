#pragma once

#include <memory>
#include <string>
#include <vector>

namespace klang {

/// Fixed-length circular delay line with a single cursor.
/// peek() reads the oldest sample, append() overwrites it and advances, so
/// a value appended now is peeked again exactly getLength() appends later.
class RingBuffer {
public:
    // Length must lie in [1, kMaxRingBufferCapacity].
    static std::unique_ptr<RingBuffer> create(int length, std::string& error);

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    double peek() const { return data_[static_cast<size_t>(position_)]; }

    void append(double value)
    {
        data_[static_cast<size_t>(position_)] = value;
        if (++position_ == length_)
            position_ = 0;
    }

    int getLength() const { return length_; }
    int getPosition() const { return position_; }

    void clear();

private:
    explicit RingBuffer(int length);

    int length_;
    int position_ = 0;
    std::vector<double> data_;
};

} // namespace klang
