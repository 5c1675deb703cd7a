#pragma once
/** @file  DispatchConfig.hpp
 *  @brief Validated runtime settings for the dispatch daemon.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/Logger.hpp"

namespace pantheon::core {

  /**
 * @struct DispatchConfig
 * @brief Every key is optional; missing keys keep the defaults below.
 *
 *  The departure countdown defaults to 600 ticks of 1 s: the truck must
 *  clear the bay within ten minutes of the manifest upload.
 */
  struct DispatchConfig {
    std::int64_t departureLeadTicks{ 600 };
    std::chrono::milliseconds countdownPeriod{ 1000 };
    std::chrono::milliseconds monitorPeriod{ 1000 };

    std::string readerDevice{ "/dev/rfid0" };
    unsigned int readerBaud{ 115200 };

    std::string tagDatabasePath{};
    std::string notificationSpoolPath{ "pantheon-notifications.jsonl" };

    std::string logCsvPath{};
    LogLevel logLevel{ LogLevel::Info };

    /// Throws std::invalid_argument on wrong types or out-of-range values.
    static DispatchConfig fromJson(const nlohmann::json& doc);
  };

} // namespace pantheon::core
