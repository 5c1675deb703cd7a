#pragma once
/** @file  MonitorState.hpp
 *  @brief The dispatch monitor's shared record and its copyable snapshot.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <optional>

// Pantheon headers
#include "core/CountdownTimer.hpp"
#include "core/SystemState.hpp"
#include "protocols/ShipmentManifest.hpp"
#include "protocols/TagReport.hpp"

namespace pantheon::core {

  using protocols::ShipmentManifest;
  using protocols::TagSet;

  /**
 * @struct MonitorSnapshot
 * @brief Value copy of the whole record taken in one step.
 *
 *  Evaluator input and status-query reply; never aliases live state.
 */
  struct MonitorSnapshot {
    SystemState state{ SystemState::Idle };
    std::optional<ShipmentManifest> manifest;
    std::optional<TagSet> tagsRead;
    TimerReading timer;

    /// Terminal state of the most recently closed cycle, if any.
    std::optional<SystemState> lastOutcome;
    /// Hard resets performed since start.
    std::uint64_t recoveries{ 0 };
  };

  /**
 * @class MonitorState
 * @brief Manifest, tag-read set, departure countdown and current state.
 *
 *  * Has no locks of its own: exactly one context (the DispatchController
 *    owner thread) touches it, so every method is one indivisible update
 *    relative to all other producers, which only reach it through events.
 *  * Invariants after every method:
 *      - manifest present  => state in {TruckDeparting, MissingTags, ShipmentComplete, Invalid}
 *      - manifest absent   => state in {Idle, ExtraTags, Invalid}
 *      - the timer is rearmed (current == starting) whenever no cycle is active.
 */
  class MonitorState {
  public:
    MonitorState(std::int64_t leadTicks, std::chrono::milliseconds countdownPeriod,
                 std::unique_ptr<io::TickSource> countdownTicks);

    MonitorSnapshot snapshot() const;

    bool cycleActive() const { return manifest_.has_value(); }
    SystemState current() const { return current_; }

    /// Install + rearm/start the countdown + empty tag set + TruckDeparting, in one step.
    void beginCycle(ShipmentManifest manifest, CountdownTimer::TickHandler onTick);

    /// Union \p tags into the read set (creating it if absent). Returns how many were new.
    std::size_t mergeTags(const TagSet& tags);

    /// Apply one countdown tick from the arming identified by \p generation.
    bool applyTimerTick(std::uint64_t generation);

    /// Clear manifest / tags, rearm + stop the timer, state -> Idle.
    void softReset();

    /// Stop the countdown ticking source (shutdown); values are kept.
    void haltCountdown();

    void commit(SystemState next) { current_ = next; }
    void recordOutcome(SystemState outcome) { lastOutcome_ = outcome; }
    void countRecovery() { ++recoveries_; }

  private:
    std::optional<ShipmentManifest> manifest_;
    std::optional<TagSet> tagsRead_;
    CountdownTimer departureTimer_;
    SystemState current_{ SystemState::Idle };
    std::optional<SystemState> lastOutcome_;
    std::uint64_t recoveries_{ 0 };
  };

} // namespace pantheon::core
