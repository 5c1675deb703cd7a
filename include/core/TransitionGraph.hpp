#pragma once
/** @file  TransitionGraph.hpp
 *  @brief Static table of legal SystemState moves.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <vector>

// Pantheon headers
#include "core/SystemState.hpp"

namespace pantheon::core {

  namespace detail {
    constexpr std::uint8_t stateBit(SystemState s) {
      return static_cast<std::uint8_t>(1u << static_cast<std::uint8_t>(s));
    }
  } // namespace detail

  /**
 * @class TransitionGraph
 * @brief Read-only successor sets, one bitmask per source state.
 *
 *  * Self-loops exist only for Idle and TruckDeparting.
 *  * A target outside the successor set is a protocol violation; the
 *    DispatchController answers it with a hard reset.
 */
  class TransitionGraph {
  public:
    static bool isLegal(SystemState from, SystemState to);

    /// Successors of \p from in enum order.
    static std::vector<SystemState> successors(SystemState from);

  private:
    static constexpr std::size_t kStates = static_cast<std::size_t>(SystemState::Count);

    // indexed by source state
    static constexpr std::array<std::uint8_t, kStates> successors_{ {
        /* Idle */
        detail::stateBit(SystemState::Idle) | detail::stateBit(SystemState::TruckDeparting) |
            detail::stateBit(SystemState::MissingTags) | detail::stateBit(SystemState::Invalid),
        /* TruckDeparting */
        detail::stateBit(SystemState::TruckDeparting) |
            detail::stateBit(SystemState::MissingTags) | detail::stateBit(SystemState::ExtraTags) |
            detail::stateBit(SystemState::ShipmentComplete) | detail::stateBit(SystemState::Invalid),
        /* MissingTags */
        detail::stateBit(SystemState::Idle) | detail::stateBit(SystemState::Invalid),
        /* ExtraTags */
        detail::stateBit(SystemState::Idle) | detail::stateBit(SystemState::Invalid),
        /* ShipmentComplete */
        detail::stateBit(SystemState::Idle) | detail::stateBit(SystemState::Invalid),
        /* Invalid */
        detail::stateBit(SystemState::Idle),
    } };
  };

} // namespace pantheon::core
