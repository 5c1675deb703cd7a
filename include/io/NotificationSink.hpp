#pragma once
/** @file  NotificationSink.hpp
 *  @brief Fire-and-forget outbound notification queue + JSON-lines spool implementation.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "protocols/Notification.hpp"

namespace pantheon {
  namespace core {
    class Logger;
    template <typename T> class RingBuffer;
  } // namespace core

  namespace io {

    class FileLogger;

    /**
 * @class NotificationSink
 * @brief Accepts notifications for delivery; must return without waiting on I/O.
 */
    class NotificationSink {
    public:
      virtual ~NotificationSink() = default;

      /** @returns false if the notification could not even be queued. */
      virtual bool enqueue(protocols::Notification note) = 0;
    };

    /**
 * @class SpoolNotifier
 * @brief Appends each notification as one JSON line to a spool file that an
 *        SMS / e-mail relay tails.
 *
 *  * Bounded queue drained by its own worker thread.
 *  * Flushes after every line so the relay sees it promptly.
 */
    class SpoolNotifier : public NotificationSink {
    public:
      SpoolNotifier(std::string spoolPath, std::shared_ptr<core::Logger> logger,
                    std::size_t capacity = 256);
      ~SpoolNotifier() override;

      SpoolNotifier(const SpoolNotifier&) = delete;
      SpoolNotifier& operator=(const SpoolNotifier&) = delete;

      /// Open the spool file and launch the worker; throws std::runtime_error.
      void start();
      /// Deliver everything queued, then join the worker.
      void stop();

      bool enqueue(protocols::Notification note) override;

      std::uint64_t delivered() const { return delivered_.load(); }

    private:
      void drain();
      void deliver(const protocols::Notification& note);

      std::string path_;
      std::shared_ptr<core::Logger> logger_;
      std::unique_ptr<core::RingBuffer<protocols::Notification>> queue_;
      std::unique_ptr<FileLogger> spool_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::uint64_t> delivered_{ 0 };
    };

  } // namespace io
} // namespace pantheon
