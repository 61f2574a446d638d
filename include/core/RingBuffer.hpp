#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO that overwrites its oldest element when full.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace reveille {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Single-owner circular queue used by Logger between producers and its worker.
 *
 *  * Not synchronised; the owner holds its own lock around every call.
 *  * `push()` never blocks and never allocates after construction.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be > 0");
      }

      /// @returns true if the oldest element was overwritten to make room.
      bool push(T value) {
        bool overwrote = false;
        if (count_ == slots_.size()) {
          head_ = (head_ + 1) % slots_.size();
          --count_;
          overwrote = true;
        }
        slots_[(head_ + count_) % slots_.size()] = std::move(value);
        ++count_;
        return overwrote;
      }

      std::optional<T> pop() {
        if (count_ == 0)
          return std::nullopt;
        T out = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return out;
      }

      std::size_t size() const { return count_; }
      std::size_t capacity() const { return slots_.size(); }
      bool empty() const { return count_ == 0; }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };  ///< index of the oldest element
      std::size_t count_{ 0 };
    };

  } // namespace core
} // namespace reveille
