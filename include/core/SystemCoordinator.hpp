#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for pantheon::core::SystemCoordinator.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <iosfwd>
#include <memory>
#include <string>

#include "core/DispatchConfig.hpp"

namespace pantheon {
  namespace io {
    class ReaderDriver;
    class SpoolNotifier;
  } // namespace io

  namespace core {

    class DispatchController;
    class ErrorMonitor;
    class InMemoryTagDatabase;
    class Logger;

    /**
 * @class SystemCoordinator
 * @brief Boots the daemon, wires the subsystems together and serves the
 *        operator console that stands in for the HTTP routes.
 *
 *  Console commands, one per line:
 *    manifest <path> | status | reader on|off|status |
 *    tag put <id> <product> [description] | tag get <id> | tag delete <id> |
 *    help | quit
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, RUNNING, STOPPED, ERROR };

      SystemCoordinator();
      ~SystemCoordinator();

      /// Load config from \p configPath, open the serial reader, start subsystems.
      void initialize(const std::string& configPath);
      /// Same, with an already-built reader driver.
      void initialize(const DispatchConfig& config, std::shared_ptr<io::ReaderDriver> reader);

      /// Console loop until `quit` or EOF. Returns the process exit code.
      int run(std::istream& in, std::ostream& out);

      /// Execute one console line. Returns false when the console should exit.
      bool handleCommand(const std::string& line, std::ostream& out);

      void shutdown(); ///< drain + stop everything; idempotent
      void handleError(const std::string& reason);

      State state() const { return currentState_; }

    private:
      void transitionTo(State next);

      void cmdManifest(const std::string& path, std::ostream& out);
      void cmdStatus(std::ostream& out);
      void cmdReader(const std::string& arg, std::ostream& out);
      void cmdTag(std::istream& args, std::ostream& out);

      State currentState_{ State::BOOT };

      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errors_;
      std::shared_ptr<InMemoryTagDatabase> tags_;
      std::shared_ptr<io::SpoolNotifier> notifier_;
      std::shared_ptr<io::ReaderDriver> reader_;
      std::unique_ptr<DispatchController> controller_;
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace pantheon
