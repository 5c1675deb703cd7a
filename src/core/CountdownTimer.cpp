/* @file CountdownTimer.cpp
 * @brief generation-guarded countdown driven by an io::TickSource
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Pantheon headers
#include "core/CountdownTimer.hpp"

using namespace pantheon::core;

CountdownTimer::CountdownTimer(std::int64_t startingValue, std::chrono::milliseconds period,
                               std::unique_ptr<io::TickSource> source)
    : starting_(startingValue), current_(startingValue), period_(period),
      source_(std::move(source)) {
  if (!source_)
    throw std::invalid_argument("[CountdownTimer] tick source is nullptr");
  if (period_.count() <= 0)
    throw std::invalid_argument("[CountdownTimer] period must be positive");
}

CountdownTimer::~CountdownTimer() { source_->stop(); }

void CountdownTimer::start(TickHandler onTick) {
  if (!onTick)
    throw std::invalid_argument("[CountdownTimer] tick handler is empty");

  source_->stop();
  current_ = starting_;
  running_ = true;
  const auto armed = ++generation_;
  source_->start(period_, [onTick = std::move(onTick), armed] { onTick(armed); });
}

void CountdownTimer::stop() {
  source_->stop();
  running_ = false;
  ++generation_;
}

void CountdownTimer::reset() {
  stop();
  current_ = starting_;
}

bool CountdownTimer::applyTick(std::uint64_t generation) {
  if (!running_ || generation != generation_)
    return false;
  --current_;
  return true;
}

TimerReading CountdownTimer::reading() const {
  return TimerReading{ starting_, current_, period_, running_ };
}
