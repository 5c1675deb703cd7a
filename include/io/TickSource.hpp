#pragma once
/** @file  TickSource.hpp
 *  @brief Periodic tick generator (abstract) and its std::thread implementation.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace pantheon {
  namespace io {

    /**
 * @class TickSource
 * @brief Invokes a callback once per period until stopped.
 *
 *  * The callback runs on the source's own context and must only hand work
 *    off (enqueue), never block.
 *  * Tests swap in a manually fired fake.
 */
    class TickSource {
    public:
      using Callback = std::function<void()>;

      virtual ~TickSource() = default;

      /// (Re)start ticking; a running source is stopped first.
      virtual void start(std::chrono::milliseconds period, Callback onTick) = 0;

      /// Idempotent. No callback fires after stop() returns.
      virtual void stop() = 0;

      virtual bool running() const = 0;
    };

    /**
 * @class ThreadTickSource
 * @brief Fixed-rate ticker on a dedicated std::thread (condition-variable sleep).
 *
 *  Deadlines advance by exactly one period per tick, so a slow callback
 *  does not drift the schedule.
 */
    class ThreadTickSource : public TickSource {
    public:
      ThreadTickSource() = default;
      ~ThreadTickSource() override;

      void start(std::chrono::milliseconds period, Callback onTick) override;
      void stop() override;
      bool running() const override;

      //---non-copyable, non-movable (owns a thread bound to this)------------
      ThreadTickSource(const ThreadTickSource&) = delete;
      ThreadTickSource& operator=(const ThreadTickSource&) = delete;

    private:
      void loop(std::chrono::milliseconds period, Callback onTick);

      std::thread th_;
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      bool running_{ false };
    };

  } // namespace io
} // namespace pantheon
