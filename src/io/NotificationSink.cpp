/* @file NotificationSink.cpp
 * @brief JSON-lines notification spool with a worker thread
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Pantheon headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"
#include "io/NotificationSink.hpp"

using namespace pantheon::io;
using pantheon::core::LogLevel;

SpoolNotifier::SpoolNotifier(std::string spoolPath, std::shared_ptr<core::Logger> logger,
                             std::size_t capacity)
    : path_(std::move(spoolPath)), logger_(std::move(logger)),
      queue_(std::make_unique<core::RingBuffer<protocols::Notification>>(capacity)) {
  if (!logger_)
    throw std::invalid_argument("[SpoolNotifier] logger is nullptr");
}

SpoolNotifier::~SpoolNotifier() { stop(); }

void SpoolNotifier::start() {
  if (running_.load())
    return;

  auto file = std::make_unique<FileLogger>();
  if (!file->open(path_))
    throw std::runtime_error("[SpoolNotifier] cannot open spool " + path_);
  spool_ = std::move(file);

  running_.store(true);
  worker_ = std::thread(&SpoolNotifier::drain, this);
}

void SpoolNotifier::stop() {
  if (!running_.exchange(false))
    return;

  queue_->wake();
  if (worker_.joinable())
    worker_.join();

  while (auto note = queue_->tryPop())
    deliver(*note);

  spool_->close();
}

bool SpoolNotifier::enqueue(protocols::Notification note) {
  if (!running_.load()) {
    logger_->log(LogLevel::Error, "SpoolNotifier",
                 std::string("not running; dropped ") + protocols::toString(note.kind));
    return false;
  }
  if (!queue_->push(std::move(note))) {
    logger_->log(LogLevel::Error, "SpoolNotifier", "queue full; notification dropped");
    return false;
  }
  return true;
}

void SpoolNotifier::drain() {
  while (running_.load()) {
    if (auto note = queue_->popFor(std::chrono::milliseconds{ 50 }))
      deliver(*note);
  }
}

void SpoolNotifier::deliver(const protocols::Notification& note) {
  if (!spool_->write(note.toWire()) || !spool_->flush()) {
    logger_->log(LogLevel::Error, "SpoolNotifier",
                 std::string("failed to spool ") + protocols::toString(note.kind));
    return;
  }
  delivered_.fetch_add(1);
  logger_->log(LogLevel::Info, "SpoolNotifier",
               std::string("spooled ") + protocols::toString(note.kind) + " notification");
}
