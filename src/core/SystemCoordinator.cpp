/* @file SystemCoordinator.cpp
 * @brief daemon boot sequence, subsystem wiring and operator console
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <sstream>
#include <stdexcept>

// Third-party headers
#include <nlohmann/json.hpp>

// Pantheon headers
#include "core/ConfigLoader.hpp"
#include "core/DispatchController.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SystemCoordinator.hpp"
#include "core/TagDatabase.hpp"
#include "io/NotificationSink.hpp"
#include "io/SerialReaderDriver.hpp"
#include "protocols/ShipmentManifest.hpp"
#include "protocols/StatusReport.hpp"

using namespace pantheon::core;

namespace pantheon::core {

  const char* toString(SystemCoordinator::State s) {
    switch (s) {
    case SystemCoordinator::State::BOOT:
      return "BOOT";
    case SystemCoordinator::State::INIT:
      return "INIT";
    case SystemCoordinator::State::RUNNING:
      return "RUNNING";
    case SystemCoordinator::State::STOPPED:
      return "STOPPED";
    case SystemCoordinator::State::ERROR:
      return "ERROR";
    default:
      return "UNKNOWN";
    }
  }

} // namespace pantheon::core

namespace {

  constexpr const char* kHelp = "commands:\n"
                                "  manifest <path>                      install a shipment manifest\n"
                                "  status                               print the monitor snapshot\n"
                                "  reader on|off|status                 control the RFID reader\n"
                                "  tag put <id> <product> [description] add or replace a tag record\n"
                                "  tag get <id>                         look up a tag record\n"
                                "  tag delete <id>                      remove a tag record\n"
                                "  quit                                 shut down\n";

} // namespace

SystemCoordinator::SystemCoordinator()
    : logger_(std::make_shared<Logger>()), errors_(std::make_shared<ErrorMonitor>()) {}

SystemCoordinator::~SystemCoordinator() { shutdown(); }

void SystemCoordinator::initialize(const std::string& configPath) {
  transitionTo(State::INIT);
  try {
    const auto config = DispatchConfig::fromJson(ConfigLoader(configPath).load());

    auto speed = io::SerialChannel::toSpeed(config.readerBaud);
    if (!speed)
      throw std::invalid_argument("[SystemCoordinator] unsupported reader_baud " +
                                  std::to_string(config.readerBaud));

    auto reader = std::make_shared<io::SerialReaderDriver>(std::make_unique<io::SerialChannel>(),
                                                           config.readerDevice, *speed, logger_);
    initialize(config, std::move(reader));
  } catch (const std::exception& e) {
    handleError(e.what());
    throw;
  }
}

void SystemCoordinator::initialize(const DispatchConfig& config,
                                   std::shared_ptr<io::ReaderDriver> reader) {
  if (!reader)
    throw std::invalid_argument("[SystemCoordinator] reader driver is nullptr");
  if (currentState_ != State::INIT)
    transitionTo(State::INIT);

  logger_->setMinLevel(config.logLevel);
  logger_->startNewRun(config.logCsvPath);

  errors_->registerEscalation([logger = logger_](const std::string& fault) {
    logger->log(LogLevel::Error, "ErrorMonitor", fault);
  });

  tags_ = std::make_shared<InMemoryTagDatabase>();
  if (!config.tagDatabasePath.empty()) {
    const auto loaded = tags_->seedFromFile(config.tagDatabasePath);
    logger_->log(LogLevel::Info, "SystemCoordinator",
                 "tag database seeded with " + std::to_string(loaded) + " records");
  }

  notifier_ = std::make_shared<io::SpoolNotifier>(config.notificationSpoolPath, logger_);
  notifier_->start();

  reader_ = std::move(reader);

  DispatchController::Collaborators deps;
  deps.reader = reader_;
  deps.tags = tags_;
  deps.notifier = notifier_;
  deps.errors = errors_;
  deps.logger = logger_;
  controller_ = std::make_unique<DispatchController>(config, std::move(deps));

  reader_->setTagSink([ctrl = controller_.get()](protocols::TagSet tags) {
    ctrl->ingestTags(std::move(tags));
  });

  controller_->start();

  // a dead reader is not fatal: manifests are refused until it comes up
  if (!reader_->start())
    logger_->log(LogLevel::Error, "SystemCoordinator", "reader failed to start");

  transitionTo(State::RUNNING);
}

int SystemCoordinator::run(std::istream& in, std::ostream& out) {
  if (currentState_ != State::RUNNING) {
    out << "error: not initialised (" << toString(currentState_) << ")\n";
    return 1;
  }

  std::string line;
  while (std::getline(in, line)) {
    if (!handleCommand(line, out))
      break;
  }
  return currentState_ == State::ERROR ? 1 : 0;
}

bool SystemCoordinator::handleCommand(const std::string& line, std::ostream& out) {
  std::istringstream args(line);
  std::string cmd;
  if (!(args >> cmd))
    return true;

  if (cmd == "quit" || cmd == "exit")
    return false;

  if (!controller_) {
    out << "error: not initialised\n";
    return true;
  }

  try {
    if (cmd == "manifest") {
      std::string path;
      if (!(args >> path))
        out << "error: usage: manifest <path>\n";
      else
        cmdManifest(path, out);
    } else if (cmd == "status") {
      cmdStatus(out);
    } else if (cmd == "reader") {
      std::string arg;
      args >> arg;
      cmdReader(arg, out);
    } else if (cmd == "tag") {
      cmdTag(args, out);
    } else if (cmd == "help") {
      out << kHelp;
    } else {
      out << "error: unknown command '" << cmd << "' (try help)\n";
    }
  } catch (const PreconditionViolation& e) {
    out << "error: " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    out << "error: " << e.what() << "\n";
  } catch (const std::runtime_error& e) {
    out << "error: " << e.what() << "\n";
    logger_->log(LogLevel::Error, "SystemCoordinator", e.what());
  }
  return true;
}

void SystemCoordinator::cmdManifest(const std::string& path, std::ostream& out) {
  auto manifest = protocols::ShipmentManifest::fromJson(ConfigLoader(path).load());
  const auto id = manifest.shipmentId;

  controller_->installManifest(std::move(manifest)).get();
  out << "ok shipment " << id << " installed\n";
}

void SystemCoordinator::cmdStatus(std::ostream& out) {
  out << protocols::toJson(controller_->status().get()).dump(2) << "\n";
}

void SystemCoordinator::cmdReader(const std::string& arg, std::ostream& out) {
  if (arg == "on") {
    if (reader_->start())
      out << "ok reader on\n";
    else
      out << "error: reader failed to start\n";
  } else if (arg == "off") {
    reader_->stop();
    out << "ok reader off\n";
  } else if (arg == "status") {
    out << (reader_->isActive() ? "reader active\n" : "reader inactive\n");
  } else {
    out << "error: usage: reader on|off|status\n";
  }
}

void SystemCoordinator::cmdTag(std::istream& args, std::ostream& out) {
  std::string sub, id;
  args >> sub >> id;
  if (id.empty()) {
    out << "error: usage: tag put|get|delete <id> ...\n";
    return;
  }

  if (sub == "put") {
    TagRecord record;
    record.tagId = id;
    if (!(args >> record.productCode)) {
      out << "error: usage: tag put <id> <product> [description]\n";
      return;
    }
    std::getline(args >> std::ws, record.description);
    tags_->put(record);
    out << "ok tag " << id << " stored\n";
  } else if (sub == "get") {
    auto record = tags_->get(id);
    if (!record) {
      out << "error: unknown tag " << id << "\n";
      return;
    }
    nlohmann::json doc{ { "tag_id", record->tagId },
                        { "product_code", record->productCode },
                        { "description", record->description } };
    out << doc.dump() << "\n";
  } else if (sub == "delete") {
    if (tags_->remove(id))
      out << "ok tag " << id << " deleted\n";
    else
      out << "error: unknown tag " << id << "\n";
  } else {
    out << "error: usage: tag put|get|delete <id> ...\n";
  }
}

void SystemCoordinator::shutdown() {
  if (currentState_ == State::STOPPED || currentState_ == State::BOOT)
    return;

  // reader first so no report races the drain, notifier last so the
  // controller's final notifications still reach the spool
  if (reader_)
    reader_->stop();
  if (controller_)
    controller_->stop();
  if (notifier_)
    notifier_->stop();

  transitionTo(State::STOPPED);
  logger_->finishRun();
}

void SystemCoordinator::handleError(const std::string& reason) {
  logger_->log(LogLevel::Error, "SystemCoordinator", reason);
  transitionTo(State::ERROR);
}

void SystemCoordinator::transitionTo(State next) {
  if (next == currentState_)
    return;
  logger_->log(LogLevel::Info, "SystemCoordinator",
               std::string(toString(currentState_)) + " -> " + toString(next));
  currentState_ = next;
}
