#pragma once
/** @file  CountdownTimer.hpp
 *  @brief Decrementing clock with start / stop / reset semantics.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

// Pantheon headers
#include "io/TickSource.hpp"

namespace pantheon::core {

  /// Copyable view of a CountdownTimer, used in snapshots.
  struct TimerReading {
    std::int64_t startingValue{ 0 };
    std::int64_t currentValue{ 0 };
    std::chrono::milliseconds period{ 0 };
    bool running{ false };

    bool expired() const { return currentValue <= 0; }

    bool operator==(const TimerReading&) const = default;
  };

  /**
 * @class CountdownTimer
 * @brief Counts `current` down by one per period; no floor below zero.
 *
 *  * The timer does not decrement itself. Its TickSource reports ticks to
 *    a handler tagged with the arm generation, and the owner applies them
 *    through `applyTick()` on whatever context serialises its state.
 *  * `stop()` / `reset()` bump the generation, so ticks already in flight
 *    from an earlier arming are ignored.
 *  * Not thread-safe; owned by a single context.
 */
  class CountdownTimer {
  public:
    using TickHandler = std::function<void(std::uint64_t generation)>;

    CountdownTimer(std::int64_t startingValue, std::chrono::milliseconds period,
                   std::unique_ptr<io::TickSource> source);
    ~CountdownTimer();

    //---non-copyable-------------------------------------------------------
    CountdownTimer(const CountdownTimer&) = delete;
    CountdownTimer& operator=(const CountdownTimer&) = delete;

    /// Rearm (current = starting) and start ticking into \p onTick.
    void start(TickHandler onTick);

    /// Cancel future ticks; current value is kept.
    void stop();

    /// Cancel future ticks and rearm current = starting. Leaves the timer stopped.
    void reset();

    /// Decrement once if \p generation matches the live arming. Returns true if applied.
    bool applyTick(std::uint64_t generation);

    bool isExpired() const { return current_ <= 0; }
    bool running() const { return running_; }
    std::int64_t current() const { return current_; }
    std::uint64_t generation() const { return generation_; }

    TimerReading reading() const;

  private:
    std::int64_t starting_;
    std::int64_t current_;
    std::chrono::milliseconds period_;
    bool running_{ false };
    std::uint64_t generation_{ 0 };
    std::unique_ptr<io::TickSource> source_;
  };

} // namespace pantheon::core
