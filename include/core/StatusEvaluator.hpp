#pragma once
/** @file  StatusEvaluator.hpp
 *  @brief Snapshot -> SystemState, including the exact-match completeness rule.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <memory>

#include "core/MonitorState.hpp"
#include "core/SystemState.hpp"
#include "core/TagDatabase.hpp"

namespace pantheon::core {

  /**
 * @class StatusEvaluator
 * @brief Decides which state a snapshot is in. No side effects.
 *
 *  | manifest | timer   | tags                   | result           |
 *  |----------|---------|------------------------|------------------|
 *  | absent   | -       | absent / empty         | Idle             |
 *  | absent   | -       | non-empty              | ExtraTags        |
 *  | present  | -       | absent                 | Invalid          |
 *  | present  | expired | -                      | MissingTags      |
 *  | present  | running | resolve exactly        | ShipmentComplete |
 *  | present  | running | otherwise              | TruckDeparting   |
 */
  class StatusEvaluator {
  public:
    explicit StatusEvaluator(std::shared_ptr<const TagDatabase> tags);

    SystemState evaluate(const MonitorSnapshot& snap) const;

    /// Every read tag resolves to a product, and the per-product counts equal
    /// the manifest's summed quantities; unknown tags make it incomplete.
    bool isShipmentComplete(const ShipmentManifest& manifest, const TagSet& tagsRead) const;

  private:
    std::shared_ptr<const TagDatabase> tags_;
  };

} // namespace pantheon::core
