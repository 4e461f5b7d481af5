#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>

// Lock-free single-producer single-consumer ring of fixed-size records.
// Fixed storage and no pointers, so it can be placed directly inside a
// shared-memory segment and used from two processes.
// Producer: host process (input events).
// Consumer: runtime loop (SharedMemoryRenderer::pollEvent).
template <typename T, size_t Capacity>
class SpscRing {
    static_assert(std::is_trivially_copyable_v<T>, "records are copied across processes");
    static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0,
                  "capacity must be a power of two");
    static_assert(std::atomic<uint64_t>::is_always_lock_free,
                  "shared-memory atomics must be lock-free");

public:
    // Producer: false when the ring is full (record dropped)
    bool push(const T& item) {
        uint64_t wr = writePos_.load(std::memory_order_relaxed);
        uint64_t rd = readPos_.load(std::memory_order_acquire);
        if (wr - rd >= Capacity) return false;

        buf_[wr & (Capacity - 1)] = item;
        writePos_.store(wr + 1, std::memory_order_release);
        return true;
    }

    // Consumer
    std::optional<T> pop() {
        uint64_t rd = readPos_.load(std::memory_order_relaxed);
        uint64_t wr = writePos_.load(std::memory_order_acquire);
        if (rd == wr) return std::nullopt;

        T item = buf_[rd & (Capacity - 1)];
        readPos_.store(rd + 1, std::memory_order_release);
        return item;
    }

    // How many records are waiting
    size_t available() const {
        return static_cast<size_t>(writePos_.load(std::memory_order_acquire)
                                 - readPos_.load(std::memory_order_relaxed));
    }

    static constexpr size_t capacity() { return Capacity; }

    void reset() {
        writePos_.store(0, std::memory_order_relaxed);
        readPos_.store(0, std::memory_order_relaxed);
    }

private:
    alignas(64) std::atomic<uint64_t> writePos_{0};
    alignas(64) std::atomic<uint64_t> readPos_{0};
    T buf_[Capacity];
};
