#ifndef ADDY_CORE_MPSC_RING_BUFFER_HPP_
#define ADDY_CORE_MPSC_RING_BUFFER_HPP_

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace addy {
namespace core {

/**
 * MPSC Ring Buffer - Multi Producer Single Consumer Lock-Free Queue
 *
 * A bounded queue designed to be pushed from asynchronous signal handlers
 * and drained by exactly one ordinary consumer thread.
 *
 * Key characteristics:
 * - Lock-free: Uses atomic operations only, safe inside a signal handler
 * - MPSC: Any number of producers (including nested handlers), one consumer
 * - Inline storage: No heap allocation after construction
 * - Bounded: Fixed capacity, a full queue rejects the push
 *
 * Every slot carries a sequence number. A producer claims a slot by
 * advancing the enqueue position with CAS, writes the element, then
 * publishes it by storing sequence = position + 1 (release). The consumer
 * only reads a slot whose sequence says it has been published (acquire),
 * and hands it back by storing sequence = position + Capacity.
 *
 * A producer interrupted between claiming and publishing (e.g. by a nested
 * signal handler) only delays the consumer, it never corrupts the queue.
 *
 * @tparam T The element type (must be trivially copyable)
 * @tparam Capacity The fixed capacity of the queue (must be power of 2)
 */
template <typename T, std::size_t Capacity>
class MpscRingBuffer {
 public:
  static_assert(Capacity > 1, "Capacity must be greater than one");
  static_assert((Capacity & (Capacity - 1)) == 0,
                "Capacity must be a power of 2");
  static_assert(std::is_trivially_copyable<T>::value,
                "Elements are copied inside signal handlers");
  static_assert(std::atomic<uint64_t>::is_always_lock_free,
                "Producers run in signal handlers and need lock-free atomics");

  MpscRingBuffer();

  // Non-copyable, non-movable
  MpscRingBuffer(const MpscRingBuffer&) = delete;
  MpscRingBuffer& operator=(const MpscRingBuffer&) = delete;
  MpscRingBuffer(MpscRingBuffer&&) = delete;
  MpscRingBuffer& operator=(MpscRingBuffer&&) = delete;

  ~MpscRingBuffer() = default;

  /**
   * Push an element to the back of the queue (any producer)
   * Async-signal-safe.
   * @param item The item to push
   * @return true if pushed successfully, false if queue is full
   */
  bool TryPush(const T& item) noexcept;

  /**
   * Pop the front element (Consumer only)
   * @param out Receives the popped element
   * @return true if popped successfully, false if nothing is published yet
   */
  bool TryPop(T& out) noexcept;

  /**
   * Check if the queue is empty
   * @return true if empty, false otherwise
   */
  bool Empty() const;

  /**
   * Get the number of claimed elements in the queue
   * Approximate while producers are active.
   */
  std::size_t Size() const;

  static constexpr std::size_t kCapacity = Capacity;

 private:
  struct Cell {
    std::atomic<uint64_t> sequence;
    T data;
  };

  static constexpr uint64_t kMask = Capacity - 1;

  std::array<Cell, Capacity> cells_;

  // Producers contend here
  alignas(64) std::atomic<uint64_t> enqueue_pos_{0};

  // Consumer only, kept off the producers' cache line
  alignas(64) std::atomic<uint64_t> dequeue_pos_{0};
};

// Template implementation

template <typename T, std::size_t Capacity>
MpscRingBuffer<T, Capacity>::MpscRingBuffer() {
  for (std::size_t i = 0; i < Capacity; ++i) {
    cells_[i].sequence.store(i, std::memory_order_relaxed);
  }
  enqueue_pos_.store(0, std::memory_order_relaxed);
  dequeue_pos_.store(0, std::memory_order_release);
}

template <typename T, std::size_t Capacity>
bool MpscRingBuffer<T, Capacity>::TryPush(const T& item) noexcept {
  uint64_t pos = enqueue_pos_.load(std::memory_order_relaxed);
  Cell* cell = nullptr;

  for (;;) {
    cell = &cells_[pos & kMask];
    const uint64_t seq = cell->sequence.load(std::memory_order_acquire);
    const int64_t diff = static_cast<int64_t>(seq) - static_cast<int64_t>(pos);

    if (diff == 0) {
      // Slot is free for this position, try to claim it
      if (enqueue_pos_.compare_exchange_weak(pos, pos + 1,
                                             std::memory_order_relaxed)) {
        break;
      }
    } else if (diff < 0) {
      return false;  // Queue is full
    } else {
      // Another producer claimed it first
      pos = enqueue_pos_.load(std::memory_order_relaxed);
    }
  }

  cell->data = item;

  // Publish the element to the consumer (release)
  cell->sequence.store(pos + 1, std::memory_order_release);
  return true;
}

template <typename T, std::size_t Capacity>
bool MpscRingBuffer<T, Capacity>::TryPop(T& out) noexcept {
  const uint64_t pos = dequeue_pos_.load(std::memory_order_relaxed);
  Cell* cell = &cells_[pos & kMask];
  const uint64_t seq = cell->sequence.load(std::memory_order_acquire);

  // Not yet published (empty, or a producer is still writing)
  if (static_cast<int64_t>(seq) - static_cast<int64_t>(pos + 1) < 0) {
    return false;
  }

  out = cell->data;

  // Hand the slot back to producers for the next lap (release)
  cell->sequence.store(pos + Capacity, std::memory_order_release);
  dequeue_pos_.store(pos + 1, std::memory_order_release);
  return true;
}

template <typename T, std::size_t Capacity>
bool MpscRingBuffer<T, Capacity>::Empty() const {
  return Size() == 0;
}

template <typename T, std::size_t Capacity>
std::size_t MpscRingBuffer<T, Capacity>::Size() const {
  const uint64_t read = dequeue_pos_.load(std::memory_order_acquire);
  const uint64_t write = enqueue_pos_.load(std::memory_order_acquire);
  return write > read ? static_cast<std::size_t>(write - read) : 0;
}

}  // namespace core
}  // namespace addy

#endif  // ADDY_CORE_MPSC_RING_BUFFER_HPP_
