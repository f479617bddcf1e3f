#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <new>
#include <utility>

#include "macros.h"

namespace Common {

  /// Rounds a requested capacity up to the next power of two (minimum 2)
  inline auto roundUpPow2(std::size_t n) noexcept -> std::size_t {
    if (n < 2) return 2;
    --n;
    n |= n >> 1;  n |= n >> 2;  n |= n >> 4;
    n |= n >> 8;  n |= n >> 16; n |= n >> 32;
    return n + 1;
  }

  // Multi Producer Multi Consumer lock-free queue (Vyukov bounded ring).
  // Items are moved in and out so payloads owning heap memory hand over cheaply.
  template<typename T>
  class MPMCLFQueue final {
  public:
    explicit MPMCLFQueue(std::size_t num_elems) :
        capacity_(roundUpPow2(num_elems)),
        store_(static_cast<Cell*>(std::aligned_alloc(alignof(Cell), sizeof(Cell) * capacity_))) {
      if (!store_) {
        throw std::bad_alloc();
      }

      for (std::size_t i = 0; i < capacity_; ++i) {
        new (&store_[i]) Cell();
        store_[i].sequence.store(i, std::memory_order_relaxed);
      }
    }

    ~MPMCLFQueue() {
      for (std::size_t i = 0; i < capacity_; ++i) {
        store_[i].~Cell();
      }
      std::free(store_);
    }

    // Producer side - can be called by multiple threads
    [[nodiscard]] auto enqueue(T item) noexcept -> bool {
      std::size_t pos = write_index_.load(std::memory_order_relaxed);

      for (;;) {
        auto& cell = store_[pos & (capacity_ - 1)];
        auto seq = cell.sequence.load(std::memory_order_acquire);
        auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos);

        if (diff == 0) {
          if (write_index_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
            cell.data = std::move(item);
            cell.sequence.store(pos + 1, std::memory_order_release);
            return true;
          }
        } else if (diff < 0) {
          return false;  // full
        } else {
          pos = write_index_.load(std::memory_order_relaxed);
        }
      }
    }

    // Consumer side - can be called by multiple threads
    [[nodiscard]] auto dequeue(T& item) noexcept -> bool {
      std::size_t pos = read_index_.load(std::memory_order_relaxed);

      for (;;) {
        auto& cell = store_[pos & (capacity_ - 1)];
        auto seq = cell.sequence.load(std::memory_order_acquire);
        auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos + 1);

        if (diff == 0) {
          if (read_index_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
            item = std::move(cell.data);
            cell.sequence.store(pos + capacity_, std::memory_order_release);
            return true;
          }
        } else if (diff < 0) {
          return false;  // empty
        } else {
          pos = read_index_.load(std::memory_order_relaxed);
        }
      }
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
      return read_index_.load(std::memory_order_acquire) ==
             write_index_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    MPMCLFQueue() = delete;
    DELETE_COPY_AND_MOVE(MPMCLFQueue);

  private:
    struct Cell {
      alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> sequence;
      T data;

      Cell() : sequence(0), data() {}
    };

    const std::size_t capacity_;
    Cell* store_;

    alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> write_index_{0};
    alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> read_index_{0};
  };

} // namespace Common
