/* @file Logger.cpp
 * @brief worker-thread logger writing stderr lines and optional CSV rows
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>
#include <iostream>
#include <stdexcept>

// Pantheon headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

using namespace pantheon::core;

namespace pantheon::core {

  const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Error:
      return "error";
    default:
      return "unknown";
    }
  }

  std::optional<LogLevel> logLevelFromString(const std::string& name) {
    for (auto level : { LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error }) {
      if (name == toString(level))
        return level;
    }
    return std::nullopt;
  }

} // namespace pantheon::core

namespace {

  constexpr auto kPollInterval = std::chrono::milliseconds{ 50 };

  std::string timestamp(std::chrono::system_clock::time_point when) {
    const auto secs = std::chrono::system_clock::to_time_t(when);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900,
                  utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(ms));
    return buf;
  }

  const char* paddedLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO ";
    case LogLevel::Warn:
      return "WARN ";
    case LogLevel::Error:
      return "ERROR";
    default:
      return "?????";
    }
  }

  std::string csvQuote(const std::string& field) {
    std::string out = "\"";
    for (char c : field) {
      if (c == '"')
        out += '"';
      out += c;
    }
    return out + "\"";
  }

} // namespace

Logger::Logger(std::size_t capacity)
    : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  if (running_.load())
    return;

  if (!csvPath.empty()) {
    auto file = std::make_unique<io::FileLogger>();
    if (!file->open(csvPath))
      throw std::runtime_error("[Logger] cannot open CSV log " + csvPath);
    if (!file->write("timestamp,level,component,message\n"))
      throw std::runtime_error("[Logger] cannot write CSV header to " + csvPath);
    csvFile_ = std::move(file);
  }

  running_.store(true);
  worker_ = std::thread(&Logger::drain, this);
}

void Logger::log(LogLevel level, std::string component, std::string message) {
  LogEvent event;
  event.level = level;
  event.component = std::move(component);
  event.message = std::move(message);
  log(event);
}

void Logger::log(const LogEvent& event) {
  if (event.level < minLevel_.load())
    return;

  if (!running_.load()) {
    write(event);
    return;
  }

  if (!buffer_->push(event)) {
    dropped_.fetch_add(1);
    return;
  }

  // finishRun() may have drained between our running_ check and the push
  if (!running_.load()) {
    while (auto late = buffer_->tryPop())
      write(*late);
  }
}

std::size_t Logger::pending() const { return buffer_->size(); }

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;

  buffer_->wake();
  if (worker_.joinable())
    worker_.join();

  while (auto event = buffer_->tryPop())
    write(*event);

  if (dropped_.load() > 0) {
    LogEvent summary;
    summary.level = LogLevel::Warn;
    summary.component = "Logger";
    summary.message = std::to_string(dropped_.load()) + " events dropped (buffer full)";
    write(summary);
  }

  std::lock_guard<std::mutex> lk(writeMtx_);
  if (csvFile_) {
    csvFile_->close();
    csvFile_.reset();
  }
}

std::string Logger::format(const LogEvent& event) {
  return timestamp(event.when) + " " + paddedLevel(event.level) + " [" + event.component + "] " +
         event.message;
}

std::string Logger::formatCsv(const LogEvent& event) {
  return timestamp(event.when) + "," + toString(event.level) + "," + csvQuote(event.component) +
         "," + csvQuote(event.message) + "\n";
}

void Logger::drain() {
  while (running_.load()) {
    if (auto event = buffer_->popFor(kPollInterval))
      write(*event);
  }
}

void Logger::write(const LogEvent& event) {
  std::lock_guard<std::mutex> lk(writeMtx_);
  std::cerr << format(event) << '\n';
  if (csvFile_) {
    bool ok = csvFile_->write(formatCsv(event));
    if (ok && event.level >= LogLevel::Warn)
      ok = csvFile_->flush();
    if (!ok)
      std::cerr << "[Logger] CSV write failed; row kept on stderr only\n";
  }
}
