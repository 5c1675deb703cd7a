/* @file TickSource.cpp
 * @brief fixed-rate std::thread ticker
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <stdexcept>

#include "io/TickSource.hpp"

using namespace pantheon::io;

ThreadTickSource::~ThreadTickSource() { stop(); }

void ThreadTickSource::start(std::chrono::milliseconds period, Callback onTick) {
  if (period.count() <= 0)
    throw std::invalid_argument("[ThreadTickSource] period must be positive");
  if (!onTick)
    throw std::invalid_argument("[ThreadTickSource] tick callback is empty");

  stop();
  {
    std::lock_guard<std::mutex> lk(mtx_);
    running_ = true;
  }
  th_ = std::thread(&ThreadTickSource::loop, this, period, std::move(onTick));
}

void ThreadTickSource::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    running_ = false;
  }
  cv_.notify_all();
  if (th_.joinable() && th_.get_id() != std::this_thread::get_id())
    th_.join();
}

bool ThreadTickSource::running() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return running_;
}

void ThreadTickSource::loop(std::chrono::milliseconds period, Callback onTick) {
  auto next = std::chrono::steady_clock::now() + period;

  std::unique_lock<std::mutex> lk(mtx_);
  while (running_) {
    if (cv_.wait_until(lk, next, [this] { return !running_; }))
      break; // stopped while sleeping

    lk.unlock();
    onTick();
    next += period;
    lk.lock();
  }
}
