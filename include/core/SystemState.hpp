#pragma once
/** @file  SystemState.hpp
 *  @brief The six states of the dispatch monitor.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <cstdint>

namespace pantheon::core {

  enum class SystemState : std::uint8_t {
    Idle,             ///< no manifest, no tags
    TruckDeparting,   ///< manifest active, countdown running, shipment incomplete
    MissingTags,      ///< manifest active, countdown expired before completion
    ExtraTags,        ///< tags read with no manifest to explain them
    ShipmentComplete, ///< tags read resolve exactly to the manifest
    Invalid,          ///< inconsistent record; should never be evaluated
    Count
  };
  static_assert(static_cast<std::uint8_t>(SystemState::Count) == 6,
                "SystemState count changed please update TransitionGraph");

  inline const char* toString(SystemState s) {
    switch (s) {
    case SystemState::Idle:
      return "idle";
    case SystemState::TruckDeparting:
      return "truck-departing";
    case SystemState::MissingTags:
      return "missing-tags";
    case SystemState::ExtraTags:
      return "extra-tags";
    case SystemState::ShipmentComplete:
      return "shipment-complete";
    case SystemState::Invalid:
      return "invalid";
    default:
      return "unknown";
    }
  }

} // namespace pantheon::core
