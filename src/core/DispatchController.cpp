/* @file DispatchController.cpp
 * @brief event loop, manifest intake, tag ingestion and transition enforcement
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <sstream>

// Pantheon headers
#include "core/DispatchController.hpp"
#include "core/TransitionGraph.hpp"

using namespace pantheon::core;
using pantheon::protocols::NotificationKind;

namespace {

  std::unique_ptr<pantheon::io::TickSource> orThreadTicker(
      std::unique_ptr<pantheon::io::TickSource> source) {
    if (source)
      return source;
    return std::make_unique<pantheon::io::ThreadTickSource>();
  }

  std::string describe(const MonitorSnapshot& snap) {
    std::ostringstream out;
    out << "state=" << toString(snap.state)
        << " manifest=" << (snap.manifest ? snap.manifest->shipmentId : "<none>") << " tags=";
    if (snap.tagsRead)
      out << snap.tagsRead->size();
    else
      out << "<none>";
    out << " countdown=" << snap.timer.currentValue;
    return out.str();
  }

} // namespace

DispatchController::DispatchController(const DispatchConfig& config, Collaborators deps,
                                       std::unique_ptr<io::TickSource> monitorTicks,
                                       std::unique_ptr<io::TickSource> countdownTicks)
    : config_(config), deps_(std::move(deps)), evaluator_(deps_.tags),
      state_(config_.departureLeadTicks, config_.countdownPeriod,
             orThreadTicker(std::move(countdownTicks))),
      monitorTicks_(orThreadTicker(std::move(monitorTicks))) {
  if (!deps_.reader)
    throw std::invalid_argument("[DispatchController] reader driver is nullptr");
  if (!deps_.notifier)
    throw std::invalid_argument("[DispatchController] notification sink is nullptr");
  if (!deps_.errors)
    throw std::invalid_argument("[DispatchController] error monitor is nullptr");
  if (!deps_.logger)
    throw std::invalid_argument("[DispatchController] logger is nullptr");
}

DispatchController::~DispatchController() { stop(); }

//---lifecycle----------------------------------------------------------------

void DispatchController::start() {
  {
    std::lock_guard<std::mutex> lk(queueMtx_);
    if (started_)
      throw std::runtime_error("[DispatchController] already started");
    started_ = true;
    accepting_ = true;
  }
  owner_ = std::thread(&DispatchController::run, this);
  monitorTicks_->start(config_.monitorPeriod, [this] { tryPost(MonitorTick{}); });
  log(LogLevel::Info, "monitor started, period " + std::to_string(config_.monitorPeriod.count()) +
                          " ms, departure countdown " +
                          std::to_string(config_.departureLeadTicks) + " ticks");
}

void DispatchController::stop() {
  // only the caller that closes intake tears down; later callers return at once
  {
    std::lock_guard<std::mutex> lk(queueMtx_);
    if (!accepting_)
      return;
    accepting_ = false;
    queue_.emplace_back(Shutdown{});
  }
  queueCv_.notify_one();

  monitorTicks_->stop(); // late ticks are refused by tryPost
  if (owner_.joinable())
    owner_.join();
  log(LogLevel::Info, "monitor stopped");
}

bool DispatchController::running() const {
  std::lock_guard<std::mutex> lk(queueMtx_);
  return accepting_;
}

//---producers------------------------------------------------------------------

std::future<void> DispatchController::installManifest(ShipmentManifest manifest) {
  manifest.validate();

  InstallManifest ev{ std::move(manifest), {} };
  auto result = ev.done.get_future();
  post(std::move(ev));
  return result;
}

bool DispatchController::ingestTags(TagSet tags) {
  if (tags.empty())
    return true;
  if (!tryPost(IngestTags{ std::move(tags) })) {
    log(LogLevel::Warn, "tag report arrived after shutdown; ignored");
    return false;
  }
  return true;
}

std::future<MonitorSnapshot> DispatchController::status() {
  StatusQuery ev;
  auto result = ev.reply.get_future();
  post(std::move(ev));
  return result;
}

void DispatchController::post(Event ev) {
  if (!tryPost(std::move(ev)))
    throw std::runtime_error("[DispatchController] not running");
}

bool DispatchController::tryPost(Event ev) {
  {
    std::lock_guard<std::mutex> lk(queueMtx_);
    if (!accepting_)
      return false;
    queue_.push_back(std::move(ev));
  }
  queueCv_.notify_one();
  return true;
}

//---owner thread---------------------------------------------------------------

void DispatchController::run() {
  for (;;) {
    Event ev;
    {
      std::unique_lock<std::mutex> lk(queueMtx_);
      queueCv_.wait(lk, [this] { return !queue_.empty(); });
      ev = std::move(queue_.front());
      queue_.pop_front();
    }

    std::visit([this](auto& e) { handle(e); }, ev);
    if (std::holds_alternative<Shutdown>(ev))
      return;
  }
}

void DispatchController::handle(InstallManifest& ev) {
  auto refuse = [&ev](const std::string& why) {
    ev.done.set_exception(
        std::make_exception_ptr(PreconditionViolation("[DispatchController] " + why)));
  };

  if (!deps_.reader->isActive()) {
    refuse("reader is not active");
    return;
  }
  if (state_.cycleActive()) {
    refuse("shipment " + state_.snapshot().manifest->shipmentId + " is still active");
    return;
  }
  if (state_.current() == SystemState::ExtraTags) {
    refuse("unexpected tags pending; wait for the monitor to return to idle");
    return;
  }

  const auto shipmentId = ev.manifest.shipmentId;
  const auto items = ev.manifest.expectedItemCount();
  state_.beginCycle(std::move(ev.manifest),
                    [this](std::uint64_t generation) { tryPost(TimerTick{ generation }); });

  log(LogLevel::Info, "shipment " + shipmentId + " installed (" + std::to_string(items) +
                          " items), countdown armed");
  ev.done.set_value();
}

void DispatchController::handle(IngestTags& ev) {
  const auto added = state_.mergeTags(ev.tags);
  if (added > 0)
    log(LogLevel::Debug, std::to_string(added) + " new tag(s) read");
}

void DispatchController::handle(TimerTick& ev) { state_.applyTimerTick(ev.generation); }

void DispatchController::handle(MonitorTick&) {
  const MonitorSnapshot snap = state_.snapshot();
  const SystemState from = snap.state;
  const SystemState to = evaluator_.evaluate(snap);

  if (!TransitionGraph::isLegal(from, to)) {
    const std::string fault = std::string("[DispatchController] illegal transition ") +
                              toString(from) + " -> " + toString(to);
    deps_.errors->notifyFailure(fault);
    hardReset(fault);
    return;
  }

  const TransitionAction action = actionFor(from, to);
  if (from != to)
    log(LogLevel::Info, std::string(toString(from)) + " -> " + toString(to));

  runAction(action, to, snap);

  if (resetsCycle(action))
    return; // already Idle
  state_.commit(to);
}

void DispatchController::handle(StatusQuery& ev) { ev.reply.set_value(state_.snapshot()); }

void DispatchController::handle(Shutdown&) { state_.haltCountdown(); }

//---actions--------------------------------------------------------------------

void DispatchController::runAction(TransitionAction action, SystemState to,
                                   const MonitorSnapshot& snap) {
  switch (action) {
  case TransitionAction::None:
    break;

  case TransitionAction::NotifyMissingAndReset:
    notify(NotificationKind::MissingTags, snap);
    state_.recordOutcome(to);
    softReset();
    break;

  case TransitionAction::NotifyExtra:
    notify(NotificationKind::ExtraTags, snap);
    state_.recordOutcome(to);
    break;

  case TransitionAction::NotifyCompleteAndReset:
    notify(NotificationKind::ShipmentComplete, snap);
    state_.recordOutcome(to);
    softReset();
    break;

  case TransitionAction::RecoverInvalid:
    log(LogLevel::Error, "inconsistent record: " + describe(snap));
    state_.recordOutcome(to);
    hardReset("invalid state");
    break;

  case TransitionAction::Unimplemented:
    log(LogLevel::Warn, std::string("no action implemented for state change ") +
                            toString(snap.state) + " -> " + toString(to));
    break;
  }
}

void DispatchController::notify(NotificationKind kind, const MonitorSnapshot& snap) {
  protocols::Notification note;
  note.kind = kind;
  note.manifest = snap.manifest;
  note.tagsRead = snap.tagsRead.value_or(TagSet{});

  if (deps_.notifier->enqueue(std::move(note)))
    log(LogLevel::Info, std::string("queued ") + protocols::toString(kind) + " notification");
  else
    log(LogLevel::Error, std::string("could not queue ") + protocols::toString(kind) +
                             " notification");
}

void DispatchController::softReset() {
  state_.softReset();
  log(LogLevel::Info, "soft reset");
}

void DispatchController::hardReset(const std::string& reason) {
  deps_.reader->resynchronize();
  state_.softReset();
  state_.countRecovery();
  log(LogLevel::Warn, "hard reset: " + reason);
}

void DispatchController::log(LogLevel level, std::string message) const {
  deps_.logger->log(level, "DispatchController", std::move(message));
}
