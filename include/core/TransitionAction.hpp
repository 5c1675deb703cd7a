#pragma once
/** @file  TransitionAction.hpp
 *  @brief Side effect bound to each (from -> to) edge of the dispatch FSM.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <cstdint>

#include "core/SystemState.hpp"

namespace pantheon::core {

  enum class TransitionAction : std::uint8_t {
    None,                    ///< same state, idling, or start of a cycle
    NotifyMissingAndReset,   ///< queue missing-tags, soft reset
    NotifyExtra,             ///< queue extra-tags, stay put
    NotifyCompleteAndReset,  ///< queue shipment-complete, soft reset
    RecoverInvalid,          ///< log the record, hard reset
    Unimplemented            ///< legal edge with no handler; logged only
  };

  /// Action for a legal edge; legality itself is TransitionGraph's call.
  TransitionAction actionFor(SystemState from, SystemState to);

  /// True for actions that close the cycle (the record ends up Idle).
  inline bool resetsCycle(TransitionAction a) {
    return a == TransitionAction::NotifyMissingAndReset ||
           a == TransitionAction::NotifyCompleteAndReset || a == TransitionAction::RecoverInvalid;
  }

  inline const char* toString(TransitionAction a) {
    switch (a) {
    case TransitionAction::None:
      return "none";
    case TransitionAction::NotifyMissingAndReset:
      return "notify-missing+soft-reset";
    case TransitionAction::NotifyExtra:
      return "notify-extra";
    case TransitionAction::NotifyCompleteAndReset:
      return "notify-complete+soft-reset";
    case TransitionAction::RecoverInvalid:
      return "hard-reset";
    case TransitionAction::Unimplemented:
      return "unimplemented";
    default:
      return "unknown";
    }
  }

} // namespace pantheon::core
