#pragma once
/** @file  DispatchController.hpp
 *  @brief Single-owner dispatch monitor: manifest intake, tag ingestion,
 *         countdown ticks and the periodic transition enforcer.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>

// Pantheon headers
#include "core/DispatchConfig.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/MonitorState.hpp"
#include "core/StatusEvaluator.hpp"
#include "core/TransitionAction.hpp"
#include "io/NotificationSink.hpp"
#include "io/ReaderDriver.hpp"
#include "io/TickSource.hpp"

namespace pantheon {
  namespace core {

    /// Manifest intake refused: reader inactive, cycle already running, or stray tags pending.
    class PreconditionViolation : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * @class DispatchController
 * @brief Owns the MonitorState on one thread and serialises every access to it.
 *
 *  * Producers (HTTP/console intake, reader callback, countdown ticker,
 *    monitor ticker, status queries) only enqueue events; the owner thread
 *    applies them one at a time, in arrival order. That ordering is what
 *    makes each multi-field read or write atomic.
 *  * Monitor tick: snapshot -> evaluate -> legality check -> edge action ->
 *    commit. An illegal target is a bookkeeping fault: it is reported to the
 *    ErrorMonitor and answered with a hard reset, never surfaced to callers.
 *  * Reset-bearing actions (missing-tags, shipment-complete, invalid) leave
 *    the record Idle; the state they reached is kept as `lastOutcome`.
 *  * `stop()` stops both tickers, drains everything already queued, and
 *    joins the owner thread.
 */
    class DispatchController {
    public:
      struct Collaborators {
        std::shared_ptr<io::ReaderDriver> reader;
        std::shared_ptr<const TagDatabase> tags;
        std::shared_ptr<io::NotificationSink> notifier;
        std::shared_ptr<ErrorMonitor> errors;
        std::shared_ptr<Logger> logger;
      };

      /// Null tick sources default to io::ThreadTickSource.
      DispatchController(const DispatchConfig& config, Collaborators deps,
                         std::unique_ptr<io::TickSource> monitorTicks = nullptr,
                         std::unique_ptr<io::TickSource> countdownTicks = nullptr);
      ~DispatchController();

      DispatchController(const DispatchController&) = delete;
      DispatchController& operator=(const DispatchController&) = delete;

      //---lifecycle----------------------------------------------------------
      void start(); ///< launch owner thread + monitor ticker
      void stop();  ///< stop tickers, drain queue, join
      bool running() const;

      //---public API---------------------------------------------------------
      /// Validates structure now (std::invalid_argument); preconditions are
      /// checked on the owner thread and reported through the future.
      std::future<void> installManifest(ShipmentManifest manifest);

      /// Tag ingestion sink for the reader driver. Returns false once stopped.
      bool ingestTags(TagSet tags);

      /// Consistent copy of the whole record.
      std::future<MonitorSnapshot> status();

    private:
      struct InstallManifest {
        ShipmentManifest manifest;
        std::promise<void> done;
      };
      struct IngestTags {
        TagSet tags;
      };
      struct TimerTick {
        std::uint64_t generation;
      };
      struct MonitorTick {};
      struct StatusQuery {
        std::promise<MonitorSnapshot> reply;
      };
      struct Shutdown {};

      using Event =
          std::variant<InstallManifest, IngestTags, TimerTick, MonitorTick, StatusQuery, Shutdown>;

      void post(Event ev);    ///< throws std::runtime_error when not accepting
      bool tryPost(Event ev); ///< ticker / reader contexts; never throws
      void run();

      void handle(InstallManifest& ev);
      void handle(IngestTags& ev);
      void handle(TimerTick& ev);
      void handle(MonitorTick& ev);
      void handle(StatusQuery& ev);
      void handle(Shutdown& ev);

      void runAction(TransitionAction action, SystemState to, const MonitorSnapshot& snap);
      void notify(protocols::NotificationKind kind, const MonitorSnapshot& snap);
      void softReset();
      void hardReset(const std::string& reason);
      void log(LogLevel level, std::string message) const;

      DispatchConfig config_;
      Collaborators deps_;
      StatusEvaluator evaluator_;
      MonitorState state_; ///< owner thread only
      std::unique_ptr<io::TickSource> monitorTicks_;

      mutable std::mutex queueMtx_;
      std::condition_variable queueCv_;
      std::deque<Event> queue_;
      bool accepting_{ false };
      bool started_{ false };
      std::thread owner_;
    };

  } // namespace core
} // namespace pantheon
