// Pantheon-Prod headers
#include "core/DispatchController.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/TagDatabase.hpp"

// Pantheon-Fake headers
#include "FakeReaderDriver.hpp"
#include "FakeTickSource.hpp"
#include "RecordingNotificationSink.hpp"

// STL headers
#include <thread>
#include <vector>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace pantheon::test {

  using core::DispatchConfig;
  using core::DispatchController;
  using core::ErrorMonitor;
  using core::InMemoryTagDatabase;
  using core::MonitorSnapshot;
  using core::PreconditionViolation;
  using core::SystemState;
  using protocols::NotificationKind;
  using protocols::ShipmentManifest;
  using protocols::TagSet;
  using ::testing::HasSubstr;

  class MockErrorMonitor : public ErrorMonitor {
  public:
    MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
  };

  class DispatchControllerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      tags = std::make_shared<InMemoryTagDatabase>();
      tags->put({ "T1", "A", "pallet" });
      tags->put({ "T2", "A", "pallet" });
      tags->put({ "T3", "B", "crate" });

      reader = std::make_shared<FakeReaderDriver>();
      notes = std::make_shared<RecordingNotificationSink>();
      errors = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      logger = std::make_shared<core::Logger>();
      logger->setMinLevel(core::LogLevel::Error);

      config.departureLeadTicks = 120;

      DispatchController::Collaborators deps;
      deps.reader = reader;
      deps.tags = tags;
      deps.notifier = notes;
      deps.errors = std::static_pointer_cast<ErrorMonitor>(errors);
      deps.logger = logger;

      auto monitor = std::make_unique<FakeTickSource>();
      auto countdown = std::make_unique<FakeTickSource>();
      monitorTicks = monitor.get();     // raw ptr for driving
      countdownTicks = countdown.get(); // raw ptr for driving

      controller = std::make_unique<DispatchController>(config, std::move(deps), std::move(monitor),
                                                        std::move(countdown));
      controller->start();
    }

    void TearDown() override { controller->stop(); }

    // FIFO queue: the reply reflects every event posted before it
    MonitorSnapshot snapshot() { return controller->status().get(); }

    MonitorSnapshot tick() {
      monitorTicks->fire();
      return snapshot();
    }

    static ShipmentManifest manifestT1T2T3() {
      ShipmentManifest m;
      m.shipmentId = "12345";
      m.orders["order1"].orderId = "order1";
      m.orders["order1"].customer = { "Fred", "fred@example.com", "27720000000" };
      m.orders["order1"].items = { { "A", 2 }, { "B", 1 } };
      return m;
    }

    DispatchConfig config;
    std::shared_ptr<InMemoryTagDatabase> tags;
    std::shared_ptr<FakeReaderDriver> reader;
    std::shared_ptr<RecordingNotificationSink> notes;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errors;
    std::shared_ptr<core::Logger> logger;
    FakeTickSource* monitorTicks = nullptr;
    FakeTickSource* countdownTicks = nullptr;
    std::unique_ptr<DispatchController> controller;
  };

  TEST_F(DispatchControllerTest, starts_idle_with_monitor_ticker_running) {
    EXPECT_TRUE(monitorTicks->running());
    EXPECT_EQ(monitorTicks->period(), config.monitorPeriod);
    EXPECT_FALSE(countdownTicks->running());

    auto snap = tick();
    EXPECT_EQ(snap.state, SystemState::Idle);
    EXPECT_FALSE(snap.manifest);
    EXPECT_FALSE(snap.tagsRead);
    EXPECT_EQ(snap.recoveries, 0u);
  }

  TEST_F(DispatchControllerTest, install_arms_cycle_and_next_tick_is_truck_departing) {
    controller->installManifest(manifestT1T2T3()).get();

    auto snap = snapshot();
    EXPECT_EQ(snap.state, SystemState::TruckDeparting);
    ASSERT_TRUE(snap.manifest);
    EXPECT_EQ(snap.manifest->shipmentId, "12345");
    ASSERT_TRUE(snap.tagsRead);
    EXPECT_TRUE(snap.tagsRead->empty());
    EXPECT_EQ(snap.timer.currentValue, 120);
    EXPECT_EQ(snap.timer.startingValue, 120);
    EXPECT_TRUE(snap.timer.running);
    EXPECT_TRUE(countdownTicks->running());
    EXPECT_EQ(countdownTicks->period(), config.countdownPeriod);

    EXPECT_EQ(tick().state, SystemState::TruckDeparting);
    EXPECT_EQ(tick().state, SystemState::TruckDeparting);
  }

  TEST_F(DispatchControllerTest, second_install_is_rejected_without_mutation) {
    controller->installManifest(manifestT1T2T3()).get();
    tick();
    controller->ingestTags({ "T1" });
    countdownTicks->fire(3);
    const auto before = snapshot();

    auto other = manifestT1T2T3();
    other.shipmentId = "99999";
    auto result = controller->installManifest(other);
    EXPECT_THROW(result.get(), PreconditionViolation);

    const auto after = snapshot();
    EXPECT_EQ(after.state, before.state);
    EXPECT_EQ(after.manifest, before.manifest);
    EXPECT_EQ(after.tagsRead, before.tagsRead);
    EXPECT_EQ(after.timer, before.timer);
  }

  TEST_F(DispatchControllerTest, install_requires_active_reader) {
    reader->active = false;
    auto result = controller->installManifest(manifestT1T2T3());
    EXPECT_THROW(result.get(), PreconditionViolation);

    auto snap = snapshot();
    EXPECT_FALSE(snap.manifest);
    EXPECT_FALSE(snap.timer.running);
    EXPECT_FALSE(countdownTicks->running());
  }

  TEST_F(DispatchControllerTest, malformed_manifest_is_rejected_before_queueing) {
    ShipmentManifest empty;
    EXPECT_THROW(controller->installManifest(empty), std::invalid_argument);
    EXPECT_FALSE(snapshot().manifest);
  }

  TEST_F(DispatchControllerTest, ingestion_is_a_union) {
    controller->installManifest(manifestT1T2T3()).get();
    EXPECT_TRUE(controller->ingestTags({ "A", "B" }));
    EXPECT_TRUE(controller->ingestTags({ "B", "C" }));
    EXPECT_TRUE(controller->ingestTags({}));

    auto snap = snapshot();
    ASSERT_TRUE(snap.tagsRead);
    EXPECT_EQ(*snap.tagsRead, (TagSet{ "A", "B", "C" }));
  }

  TEST_F(DispatchControllerTest, reader_reports_reach_the_sink) {
    reader->setTagSink([this](TagSet t) { controller->ingestTags(std::move(t)); });
    reader->report({ "E1", "E2" });

    auto snap = snapshot();
    ASSERT_TRUE(snap.tagsRead);
    EXPECT_EQ(*snap.tagsRead, (TagSet{ "E1", "E2" }));
  }

  TEST_F(DispatchControllerTest, timeout_notifies_missing_tags_then_soft_resets) {
    controller->installManifest(manifestT1T2T3()).get();
    EXPECT_EQ(tick().state, SystemState::TruckDeparting);
    controller->ingestTags({ "T1", "T2", "T3" }); // complete, but too late:
    countdownTicks->fire(120);

    auto expired = snapshot();
    EXPECT_EQ(expired.timer.currentValue, 0);

    auto snap = tick();
    EXPECT_EQ(snap.state, SystemState::Idle);
    EXPECT_FALSE(snap.manifest);
    EXPECT_FALSE(snap.tagsRead);
    EXPECT_EQ(snap.timer.currentValue, 120);
    EXPECT_FALSE(snap.timer.running);
    EXPECT_FALSE(countdownTicks->running());
    ASSERT_TRUE(snap.lastOutcome);
    EXPECT_EQ(*snap.lastOutcome, SystemState::MissingTags);
    EXPECT_EQ(snap.recoveries, 0u);

    auto sent = notes->notes();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].kind, NotificationKind::MissingTags);
    ASSERT_TRUE(sent[0].manifest);
    EXPECT_EQ(sent[0].manifest->shipmentId, "12345");
    EXPECT_EQ(sent[0].tagsRead, (TagSet{ "T1", "T2", "T3" }));

    // resting afterwards: Idle -> Idle, nothing new
    EXPECT_EQ(tick().state, SystemState::Idle);
    EXPECT_EQ(notes->notes().size(), 1u);
  }

  TEST_F(DispatchControllerTest, shipment_completes_once_all_expected_tags_are_read) {
    controller->installManifest(manifestT1T2T3()).get();
    EXPECT_EQ(tick().state, SystemState::TruckDeparting);

    controller->ingestTags({ "T1", "T2" });
    countdownTicks->fire();
    EXPECT_EQ(tick().state, SystemState::TruckDeparting);
    EXPECT_TRUE(notes->notes().empty());

    controller->ingestTags({ "T3" });
    countdownTicks->fire();
    auto snap = tick();
    EXPECT_EQ(snap.state, SystemState::Idle);
    ASSERT_TRUE(snap.lastOutcome);
    EXPECT_EQ(*snap.lastOutcome, SystemState::ShipmentComplete);
    EXPECT_FALSE(snap.manifest);

    auto sent = notes->notes();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].kind, NotificationKind::ShipmentComplete);
    EXPECT_EQ(sent[0].tagsRead, (TagSet{ "T1", "T2", "T3" }));

    // no second completion, no recovery
    snap = tick();
    EXPECT_EQ(snap.state, SystemState::Idle);
    EXPECT_EQ(snap.recoveries, 0u);
    EXPECT_EQ(notes->notes().size(), 1u);
    EXPECT_EQ(reader->resyncs.load(), 0);
  }

  TEST_F(DispatchControllerTest, completion_before_the_first_monitor_tick_is_notified) {
    EXPECT_CALL(*errors, notifyFailure(testing::_)).Times(0);

    controller->installManifest(manifestT1T2T3()).get();
    controller->ingestTags({ "T1", "T2", "T3" });

    auto snap = tick();
    EXPECT_EQ(snap.state, SystemState::Idle);
    ASSERT_TRUE(snap.lastOutcome);
    EXPECT_EQ(*snap.lastOutcome, SystemState::ShipmentComplete);
    EXPECT_EQ(snap.recoveries, 0u);
    EXPECT_EQ(reader->resyncs.load(), 0);

    auto sent = notes->notes();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].kind, NotificationKind::ShipmentComplete);
  }

  TEST_F(DispatchControllerTest, timeout_before_the_first_monitor_tick_is_notified) {
    controller->installManifest(manifestT1T2T3()).get();
    countdownTicks->fire(120);

    auto snap = tick();
    EXPECT_EQ(snap.state, SystemState::Idle);
    ASSERT_TRUE(snap.lastOutcome);
    EXPECT_EQ(*snap.lastOutcome, SystemState::MissingTags);
    EXPECT_EQ(snap.recoveries, 0u);
    ASSERT_EQ(notes->notes().size(), 1u);
    EXPECT_EQ(notes->notes()[0].kind, NotificationKind::MissingTags);
  }

  TEST_F(DispatchControllerTest, new_cycle_can_start_after_completion) {
    controller->installManifest(manifestT1T2T3()).get();
    tick();
    controller->ingestTags({ "T1", "T2", "T3" });
    tick();

    auto next = manifestT1T2T3();
    next.shipmentId = "67890";
    controller->installManifest(next).get();
    auto snap = tick();
    EXPECT_EQ(snap.state, SystemState::TruckDeparting);
    EXPECT_EQ(snap.manifest->shipmentId, "67890");
    EXPECT_EQ(countdownTicks->starts(), 2);
  }

  TEST_F(DispatchControllerTest, stray_tags_without_a_cycle_force_a_hard_reset) {
    EXPECT_CALL(*errors, notifyFailure(HasSubstr("idle -> extra-tags"))).Times(1);

    controller->ingestTags({ "BEEF" });
    auto pending = snapshot();
    EXPECT_EQ(pending.state, SystemState::Idle);
    ASSERT_TRUE(pending.tagsRead);

    auto snap = tick();
    EXPECT_EQ(snap.state, SystemState::Idle);
    EXPECT_FALSE(snap.tagsRead);
    EXPECT_EQ(snap.recoveries, 1u);
    EXPECT_EQ(reader->resyncs.load(), 1);
    EXPECT_TRUE(notes->notes().empty());
  }

  TEST_F(DispatchControllerTest, calls_after_stop_are_refused) {
    controller->installManifest(manifestT1T2T3()).get();
    controller->stop();

    EXPECT_FALSE(controller->running());
    EXPECT_FALSE(controller->ingestTags({ "T1" }));
    EXPECT_THROW(controller->status(), std::runtime_error);
    EXPECT_THROW(controller->installManifest(manifestT1T2T3()), std::runtime_error);
    EXPECT_FALSE(monitorTicks->running());
    EXPECT_FALSE(countdownTicks->running());
  }

  TEST_F(DispatchControllerTest, concurrent_stops_tear_down_once) {
    controller->installManifest(manifestT1T2T3()).get();
    auto pending = controller->status();

    std::vector<std::thread> stoppers;
    for (int i = 0; i < 4; ++i)
      stoppers.emplace_back([this] { controller->stop(); });
    for (auto& t : stoppers)
      t.join();
    controller->stop();

    EXPECT_FALSE(controller->running());
    EXPECT_FALSE(monitorTicks->running());
    EXPECT_FALSE(countdownTicks->running());
    EXPECT_EQ(pending.get().manifest->shipmentId, "12345");
  }

  TEST_F(DispatchControllerTest, queued_events_are_drained_on_stop) {
    controller->installManifest(manifestT1T2T3()).get();
    auto last = controller->status(); // queued behind nothing, answered before shutdown
    controller->ingestTags({ "T1" });
    auto afterIngest = controller->status();
    controller->stop();

    EXPECT_EQ(last.get().tagsRead->size(), 0u);
    EXPECT_EQ(afterIngest.get().tagsRead->size(), 1u);
  }

  TEST(dispatch_controller, rejects_missing_collaborators) {
    DispatchController::Collaborators deps;
    deps.tags = std::make_shared<InMemoryTagDatabase>();
    EXPECT_THROW(DispatchController(DispatchConfig{}, deps, std::make_unique<FakeTickSource>(),
                                    std::make_unique<FakeTickSource>()),
                 std::invalid_argument);
  }

} // namespace pantheon::test
