// Pantheon headers
#include "core/StatusEvaluator.hpp"
#include "core/TagDatabase.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace pantheon::test {

  using core::InMemoryTagDatabase;
  using core::MonitorSnapshot;
  using core::StatusEvaluator;
  using core::SystemState;
  using protocols::ShipmentManifest;
  using protocols::TagSet;

  class StatusEvaluatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      db = std::make_shared<InMemoryTagDatabase>();
      db->put({ "T1", "A", "pallet" });
      db->put({ "T2", "A", "pallet" });
      db->put({ "T3", "B", "crate" });
      db->put({ "T4", "B", "crate" });
      evaluator = std::make_unique<StatusEvaluator>(db);

      manifest.shipmentId = "S-100";
      manifest.orders["o1"].orderId = "o1";
      manifest.orders["o1"].items = { { "A", 1 }, { "B", 1 } };
      manifest.orders["o2"].orderId = "o2";
      manifest.orders["o2"].items = { { "A", 1 } };
    }

    MonitorSnapshot active(TagSet tags, std::int64_t countdown = 120) {
      MonitorSnapshot snap;
      snap.state = SystemState::TruckDeparting;
      snap.manifest = manifest;
      snap.tagsRead = std::move(tags);
      snap.timer.startingValue = 120;
      snap.timer.currentValue = countdown;
      snap.timer.running = true;
      return snap;
    }

    std::shared_ptr<InMemoryTagDatabase> db;
    std::unique_ptr<StatusEvaluator> evaluator;
    ShipmentManifest manifest;
  };

  TEST_F(StatusEvaluatorTest, no_manifest_no_tags_is_idle) {
    MonitorSnapshot snap;
    EXPECT_EQ(evaluator->evaluate(snap), SystemState::Idle);

    snap.tagsRead = TagSet{};
    EXPECT_EQ(evaluator->evaluate(snap), SystemState::Idle);
  }

  TEST_F(StatusEvaluatorTest, no_manifest_with_tags_is_extra_tags) {
    MonitorSnapshot snap;
    snap.tagsRead = TagSet{ "T1" };
    EXPECT_EQ(evaluator->evaluate(snap), SystemState::ExtraTags);
  }

  TEST_F(StatusEvaluatorTest, expired_countdown_wins_over_completeness) {
    EXPECT_EQ(evaluator->evaluate(active({ "T1", "T2", "T3" }, 0)), SystemState::MissingTags);
    EXPECT_EQ(evaluator->evaluate(active({}, -4)), SystemState::MissingTags);
  }

  TEST_F(StatusEvaluatorTest, exact_match_is_complete) {
    EXPECT_EQ(evaluator->evaluate(active({ "T1", "T2", "T3" })), SystemState::ShipmentComplete);
    EXPECT_EQ(evaluator->evaluate(active({ "T1", "T2", "T3" }, 1)), SystemState::ShipmentComplete);
  }

  TEST_F(StatusEvaluatorTest, partial_read_is_still_departing) {
    EXPECT_EQ(evaluator->evaluate(active({})), SystemState::TruckDeparting);
    EXPECT_EQ(evaluator->evaluate(active({ "T1", "T3" })), SystemState::TruckDeparting);
  }

  TEST_F(StatusEvaluatorTest, surplus_or_unknown_tags_are_not_complete) {
    // right count, wrong mix
    EXPECT_EQ(evaluator->evaluate(active({ "T1", "T3", "T4" })), SystemState::TruckDeparting);
    // every expected tag plus one more
    EXPECT_EQ(evaluator->evaluate(active({ "T1", "T2", "T3", "T4" })),
              SystemState::TruckDeparting);
    // a tag nobody registered
    EXPECT_EQ(evaluator->evaluate(active({ "T1", "T2", "FFFF" })), SystemState::TruckDeparting);
  }

  TEST_F(StatusEvaluatorTest, manifest_without_tag_set_is_invalid) {
    auto snap = active({});
    snap.tagsRead.reset();
    EXPECT_EQ(evaluator->evaluate(snap), SystemState::Invalid);
  }

  TEST_F(StatusEvaluatorTest, completeness_follows_database_changes) {
    EXPECT_FALSE(evaluator->isShipmentComplete(manifest, { "T1", "T2", "X9" }));
    db->put({ "X9", "B", "late registration" });
    EXPECT_TRUE(evaluator->isShipmentComplete(manifest, { "T1", "T2", "X9" }));
  }

  TEST(status_evaluator, requires_tag_database) {
    EXPECT_THROW(StatusEvaluator(nullptr), std::invalid_argument);
  }

} // namespace pantheon::test
