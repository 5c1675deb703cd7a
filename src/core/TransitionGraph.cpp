/* @file TransitionGraph.cpp
 * @brief legality queries over the successor table
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include "core/TransitionGraph.hpp"

using namespace pantheon::core;

bool TransitionGraph::isLegal(SystemState from, SystemState to) {
  const auto src = static_cast<std::size_t>(from);
  if (src >= kStates || static_cast<std::size_t>(to) >= kStates)
    return false;
  return (successors_[src] & detail::stateBit(to)) != 0;
}

std::vector<SystemState> TransitionGraph::successors(SystemState from) {
  std::vector<SystemState> out;
  for (std::size_t i = 0; i < kStates; ++i) {
    const auto to = static_cast<SystemState>(i);
    if (isLegal(from, to))
      out.push_back(to);
  }
  return out;
}
