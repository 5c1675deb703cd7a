#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, mutex-protected FIFO with a blocking timed pop.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace pantheon {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity circular queue shared by one consumer and many producers.
 *
 *  * `push()` never blocks; it returns false when full (caller decides to drop).
 *  * `popFor()` waits up to \p timeout for an element.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be non-zero");
      }

      bool push(T value) {
        {
          std::lock_guard<std::mutex> lk(mtx_);
          if (count_ == slots_.size())
            return false;
          slots_[(head_ + count_) % slots_.size()] = std::move(value);
          ++count_;
        }
        cv_.notify_one();
        return true;
      }

      std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lk(mtx_);
        return popLocked();
      }

      std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, timeout, [this] { return count_ > 0; });
        return popLocked();
      }

      /// Wake a consumer blocked in popFor() (used on shutdown).
      void wake() { cv_.notify_all(); }

      std::size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return count_;
      }

      std::size_t capacity() const { return slots_.size(); }

    private:
      std::optional<T> popLocked() {
        if (count_ == 0)
          return std::nullopt;
        std::optional<T> out{ std::move(slots_[head_]) };
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return out;
      }

      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace pantheon
