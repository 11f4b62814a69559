#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>

namespace klang {

/// Bounded lock-free FIFO for exactly one producer thread and one consumer
/// thread. One slot is kept free to tell "full" from "empty".
template<typename T, int Capacity>
class SPSCQueue {
    static_assert(Capacity > 0, "Capacity must be positive");

public:
    SPSCQueue() = default;

    SPSCQueue(const SPSCQueue&) = delete;
    SPSCQueue& operator=(const SPSCQueue&) = delete;

    // --- Producer ---
    bool tryPush(const T& item)
    {
        T copy(item);
        return tryPush(std::move(copy));
    }

    bool tryPush(T&& item)
    {
        int write = writePos_.load(std::memory_order_relaxed);
        int nextWrite = next(write);
        if (nextWrite == readPos_.load(std::memory_order_acquire))
            return false;
        slots_[static_cast<size_t>(write)] = std::move(item);
        writePos_.store(nextWrite, std::memory_order_release);
        return true;
    }

    // --- Consumer ---
    bool tryPop(T& item)
    {
        int read = readPos_.load(std::memory_order_relaxed);
        if (read == writePos_.load(std::memory_order_acquire))
            return false;
        item = std::move(slots_[static_cast<size_t>(read)]);
        readPos_.store(next(read), std::memory_order_release);
        return true;
    }

    /// Pops everything currently queued, oldest first. Returns the count.
    template<typename Handler>
    int drain(Handler&& handler)
    {
        int count = 0;
        T item;
        while (tryPop(item))
        {
            handler(item);
            ++count;
        }
        return count;
    }

    // --- Either side (approximate while the other side is active) ---
    int size() const
    {
        int write = writePos_.load(std::memory_order_acquire);
        int read = readPos_.load(std::memory_order_acquire);
        int diff = write - read;
        return diff >= 0 ? diff : diff + kSlots;
    }

    bool empty() const { return size() == 0; }
    static constexpr int capacity() { return Capacity; }

    /// Only valid while neither side is running.
    void reset()
    {
        readPos_.store(0, std::memory_order_relaxed);
        writePos_.store(0, std::memory_order_relaxed);
    }

private:
    static constexpr int kSlots = Capacity + 1;

    static int next(int pos) { return (pos + 1) % kSlots; }

    std::array<T, kSlots> slots_;
    std::atomic<int> readPos_{0};
    std::atomic<int> writePos_{0};
};

} // namespace klang
