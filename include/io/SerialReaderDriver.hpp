#pragma once
/** @file  SerialReaderDriver.hpp
 *  @brief ReaderDriver for readers that stream EPC reports as text lines over a tty.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "io/ReaderDriver.hpp"
#include "io/SerialChannel.hpp"

namespace pantheon {
  namespace core {
    class Logger;
  } // namespace core

  namespace io {

    /**
 * @class SerialReaderDriver
 * @brief Owns one SerialChannel and a poll thread that turns report lines into tag batches.
 *
 *  * Lines that fail to decode are logged and skipped.
 *  * `resynchronize()` only raises a flag; the poll thread writes `RESYNC`
 *    so callers never touch the tty.
 *  * A reader that hangs up marks the driver inactive.
 */
    class SerialReaderDriver : public ReaderDriver {
    public:
      static constexpr const char* kResyncCommand = "RESYNC";
      static constexpr std::chrono::milliseconds kPollTimeout{ 100 };

      SerialReaderDriver(std::unique_ptr<SerialChannel> channel, std::string device, speed_t baud,
                         std::shared_ptr<core::Logger> logger);
      ~SerialReaderDriver() override;

      bool start() override;
      void stop() override;
      bool isActive() const override;
      void resynchronize() override;

      const std::string& device() const { return device_; }

    private:
      void pollLoop();

      std::unique_ptr<SerialChannel> channel_;
      std::string device_;
      speed_t baud_;
      std::shared_ptr<core::Logger> logger_;

      std::thread poller_;
      std::atomic<bool> running_{ false };
      std::atomic<bool> linkUp_{ false };
      std::atomic<bool> resyncRequested_{ false };
    };

  } // namespace io
} // namespace pantheon
