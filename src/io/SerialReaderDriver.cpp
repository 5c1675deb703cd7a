/* @file SerialReaderDriver.cpp
 * @brief tty poll thread -> TagReport -> ReaderDriver::emit
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Pantheon headers
#include "core/Logger.hpp"
#include "io/SerialReaderDriver.hpp"
#include "protocols/TagReport.hpp"

using namespace pantheon::io;
using pantheon::core::LogLevel;

SerialReaderDriver::SerialReaderDriver(std::unique_ptr<SerialChannel> channel, std::string device,
                                       speed_t baud, std::shared_ptr<core::Logger> logger)
    : channel_(std::move(channel)), device_(std::move(device)), baud_(baud),
      logger_(std::move(logger)) {
  if (!channel_)
    throw std::invalid_argument("[SerialReaderDriver] serial channel is nullptr");
  if (!logger_)
    throw std::invalid_argument("[SerialReaderDriver] logger is nullptr");
}

SerialReaderDriver::~SerialReaderDriver() { stop(); }

bool SerialReaderDriver::start() {
  if (running_.load()) {
    if (linkUp_.load())
      return true;
    stop(); // link dropped earlier; reopen from scratch
  }

  if (!channel_->open(device_, baud_)) {
    logger_->log(LogLevel::Error, "SerialReaderDriver", "cannot open reader at " + device_);
    return false;
  }

  linkUp_.store(true);
  running_.store(true);
  poller_ = std::thread(&SerialReaderDriver::pollLoop, this);
  logger_->log(LogLevel::Info, "SerialReaderDriver", "reader started on " + device_);
  return true;
}

void SerialReaderDriver::stop() {
  if (!running_.exchange(false))
    return;
  if (poller_.joinable())
    poller_.join();
  channel_->close();
  linkUp_.store(false);
  logger_->log(LogLevel::Info, "SerialReaderDriver", "reader stopped");
}

bool SerialReaderDriver::isActive() const { return running_.load() && linkUp_.load(); }

void SerialReaderDriver::resynchronize() { resyncRequested_.store(true); }

void SerialReaderDriver::pollLoop() {
  while (running_.load()) {
    if (resyncRequested_.exchange(false)) {
      if (!channel_->writeLine(kResyncCommand))
        logger_->log(LogLevel::Warn, "SerialReaderDriver", "resync request not delivered");
      else
        logger_->log(LogLevel::Info, "SerialReaderDriver", "resync requested");
    }

    auto line = channel_->readLine(kPollTimeout);
    if (!channel_->isOpen()) {
      linkUp_.store(false);
      logger_->log(LogLevel::Error, "SerialReaderDriver", "reader link lost on " + device_);
      return;
    }
    if (!line || line->empty())
      continue;

    auto report = protocols::TagReport::fromWire(*line);
    if (!report) {
      logger_->log(LogLevel::Warn, "SerialReaderDriver", "undecodable report: " + *line);
      continue;
    }
    emit(std::move(report->tags));
  }
}
