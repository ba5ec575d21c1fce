#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>

namespace scape::util {

/// @brief Bounded lock-free queue for exactly one producer thread and one consumer thread.
///
/// Positions are free-running 64-bit counters; a slot index is `position & (capacity - 1)`.
template <typename T>
class SPSCQueue {
public:
    explicit SPSCQueue(size_t capacity) : m_capacity(capacity), m_mask(capacity - 1) {
        if (capacity == 0 || (capacity & (capacity - 1)) != 0) {
            throw std::invalid_argument("SPSCQueue capacity must be a power of 2");
        }
        m_slots = std::make_unique<std::optional<T>[]>(capacity);
    }

    SPSCQueue(const SPSCQueue&) = delete;
    SPSCQueue& operator=(const SPSCQueue&) = delete;
    SPSCQueue(SPSCQueue&&) = delete;
    SPSCQueue& operator=(SPSCQueue&&) = delete;

    /// Producer only. Returns false when the queue is full; @p item is dropped.
    auto try_push(T item) -> bool {
        const uint64_t write = m_write.load(std::memory_order_relaxed);
        if (write - m_read.load(std::memory_order_acquire) >= m_capacity) {
            return false;
        }
        m_slots[write & m_mask].emplace(std::move(item));
        m_write.store(write + 1, std::memory_order_release);
        return true;
    }

    /// Consumer only.
    auto try_pop() -> std::optional<T> {
        const uint64_t read = m_read.load(std::memory_order_relaxed);
        if (read == m_write.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        auto& slot = m_slots[read & m_mask];
        std::optional<T> item = std::move(slot);
        slot.reset();
        m_read.store(read + 1, std::memory_order_release);
        return item;
    }

    /// Exact only when called from the consumer or producer with the other side idle.
    [[nodiscard]] auto size() const -> size_t {
        return static_cast<size_t>(m_write.load(std::memory_order_acquire) -
                                   m_read.load(std::memory_order_acquire));
    }
    [[nodiscard]] auto empty() const -> bool { return size() == 0; }
    [[nodiscard]] auto capacity() const -> size_t { return m_capacity; }

private:
    alignas(64) std::atomic<uint64_t> m_write{0};
    alignas(64) std::atomic<uint64_t> m_read{0};
    const size_t m_capacity;
    const uint64_t m_mask;
    std::unique_ptr<std::optional<T>[]> m_slots;
};

} // namespace scape::util
