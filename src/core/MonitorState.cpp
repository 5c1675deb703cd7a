/* @file MonitorState.cpp
 * @brief whole-record mutations of the dispatch monitor
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include "core/MonitorState.hpp"

using namespace pantheon::core;

MonitorState::MonitorState(std::int64_t leadTicks, std::chrono::milliseconds countdownPeriod,
                           std::unique_ptr<io::TickSource> countdownTicks)
    : departureTimer_(leadTicks, countdownPeriod, std::move(countdownTicks)) {}

MonitorSnapshot MonitorState::snapshot() const {
  MonitorSnapshot snap;
  snap.state = current_;
  snap.manifest = manifest_;
  snap.tagsRead = tagsRead_;
  snap.timer = departureTimer_.reading();
  snap.lastOutcome = lastOutcome_;
  snap.recoveries = recoveries_;
  return snap;
}

void MonitorState::beginCycle(ShipmentManifest manifest, CountdownTimer::TickHandler onTick) {
  manifest_ = std::move(manifest);
  tagsRead_ = TagSet{};
  departureTimer_.reset();
  departureTimer_.start(std::move(onTick));
  current_ = SystemState::TruckDeparting;
}

std::size_t MonitorState::mergeTags(const TagSet& tags) {
  if (!tagsRead_)
    tagsRead_ = TagSet{};

  std::size_t added = 0;
  for (const auto& tag : tags) {
    if (tagsRead_->insert(tag).second)
      ++added;
  }
  return added;
}

bool MonitorState::applyTimerTick(std::uint64_t generation) {
  return departureTimer_.applyTick(generation);
}

void MonitorState::softReset() {
  departureTimer_.reset();
  manifest_.reset();
  tagsRead_.reset();
  current_ = SystemState::Idle;
}

void MonitorState::haltCountdown() { departureTimer_.stop(); }
