/* @file TransitionAction.cpp
 * @brief edge -> action lookup, evaluated in priority order
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include "core/TransitionAction.hpp"

namespace pantheon::core {

  TransitionAction actionFor(SystemState from, SystemState to) {
    if (from == to)
      return TransitionAction::None;

    switch (to) {
    case SystemState::MissingTags:
      return TransitionAction::NotifyMissingAndReset;
    case SystemState::ExtraTags:
      return TransitionAction::NotifyExtra;
    case SystemState::ShipmentComplete:
      return TransitionAction::NotifyCompleteAndReset;
    case SystemState::Invalid:
      return TransitionAction::RecoverInvalid;
    case SystemState::Idle:
      return TransitionAction::None;
    default:
      break;
    }

    if (from == SystemState::Idle && to == SystemState::TruckDeparting)
      return TransitionAction::None;

    return TransitionAction::Unimplemented;
  }

} // namespace pantheon::core
