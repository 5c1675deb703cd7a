#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous console + CSV logger (runs its own worker thread).
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace pantheon {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);
    std::optional<LogLevel> logLevelFromString(const std::string& name);

    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Producers enqueue, one worker thread formats and writes.
 *
 *  * Console line:  `2026-01-01T10:00:00.000Z INFO  [Component] message` on stderr.
 *  * CSV row (optional): `timestamp,level,component,message`.
 *  * Outside a run (before startNewRun / after finishRun) events are written
 *    synchronously to stderr so nothing is lost during boot and shutdown.
 */
    class Logger {

    public:
      explicit Logger(std::size_t capacity = 1024);
      ~Logger();

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

      // --- public API ---
      void startNewRun(const std::string& csvPath = {}); ///< open file + launch worker thread
      void log(const LogEvent& event);                   ///< enqueue event (non-blocking)
      void log(LogLevel level, std::string component, std::string message);
      void finishRun(); ///< flush + join worker thread

      void setMinLevel(LogLevel level) { minLevel_.store(level); }
      LogLevel minLevel() const { return minLevel_.load(); }

      std::uint64_t dropped() const { return dropped_.load(); }
      /// Events queued but not yet written.
      std::size_t pending() const;

      /// Console rendering of one event (no trailing newline).
      static std::string format(const LogEvent& event);
      /// CSV rendering of one event (with trailing newline, quoted message).
      static std::string formatCsv(const LogEvent& event);

    private:
      void drain();
      void write(const LogEvent& event);

      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::unique_ptr<io::FileLogger> csvFile_;
      std::mutex writeMtx_; ///< serialises the worker with synchronous fallback writes
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> minLevel_{ LogLevel::Info };
      std::atomic<std::uint64_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace pantheon
