/* @file StatusEvaluator.cpp
 * @brief state decision table and completeness predicate
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <map>
#include <stdexcept>

// Pantheon headers
#include "core/StatusEvaluator.hpp"

using namespace pantheon::core;

StatusEvaluator::StatusEvaluator(std::shared_ptr<const TagDatabase> tags) : tags_(std::move(tags)) {
  if (!tags_)
    throw std::invalid_argument("[StatusEvaluator] tag database is nullptr");
}

SystemState StatusEvaluator::evaluate(const MonitorSnapshot& snap) const {
  if (!snap.manifest) {
    if (snap.tagsRead && !snap.tagsRead->empty())
      return SystemState::ExtraTags;
    return SystemState::Idle;
  }

  if (!snap.tagsRead)
    return SystemState::Invalid;

  // timeout wins over partial completeness
  if (snap.timer.expired())
    return SystemState::MissingTags;

  if (isShipmentComplete(*snap.manifest, *snap.tagsRead))
    return SystemState::ShipmentComplete;

  return SystemState::TruckDeparting;
}

bool StatusEvaluator::isShipmentComplete(const ShipmentManifest& manifest,
                                         const TagSet& tagsRead) const {
  const auto expected = manifest.expectedQuantities();
  if (tagsRead.size() != static_cast<std::size_t>(manifest.expectedItemCount()))
    return false;

  std::map<std::string, std::int64_t> seen;
  for (const auto& tag : tagsRead) {
    auto record = tags_->get(tag);
    if (!record)
      return false; // not ours
    ++seen[record->productCode];
  }
  return seen == expected;
}
