/* @file main.cpp
 * @brief pantheond entry point: boot the SystemCoordinator and serve the console on stdin
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>

// Pantheon headers
#include "core/SystemCoordinator.hpp"

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << (argc > 0 ? argv[0] : "pantheond") << " <config.json>\n";
    return 2;
  }

  pantheon::core::SystemCoordinator coordinator;
  try {
    coordinator.initialize(argv[1]);
  } catch (const std::exception& e) {
    std::cerr << "[pantheond] startup failed: " << e.what() << "\n";
    coordinator.shutdown();
    return 1;
  }

  const int rc = coordinator.run(std::cin, std::cout);
  coordinator.shutdown();
  return rc;
}
