/* @file DispatchConfig.cpp
 * @brief schema checks for the daemon's JSON config
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Third-party headers
#include <nlohmann/json.hpp>

// Pantheon headers
#include "core/DispatchConfig.hpp"

using namespace pantheon::core;
using nlohmann::json;

namespace {

  std::int64_t positiveInt(const json& doc, const char* key, std::int64_t fallback) {
    if (!doc.contains(key))
      return fallback;
    const auto& v = doc.at(key);
    if (!v.is_number_integer() || v.get<std::int64_t>() <= 0)
      throw std::invalid_argument(std::string("[DispatchConfig] ") + key +
                                  " must be a positive integer");
    return v.get<std::int64_t>();
  }

  std::string stringOr(const json& doc, const char* key, const std::string& fallback) {
    if (!doc.contains(key))
      return fallback;
    const auto& v = doc.at(key);
    if (!v.is_string())
      throw std::invalid_argument(std::string("[DispatchConfig] ") + key + " must be a string");
    return v.get<std::string>();
  }

} // namespace

DispatchConfig DispatchConfig::fromJson(const json& doc) {
  if (!doc.is_object())
    throw std::invalid_argument("[DispatchConfig] config root must be a JSON object");

  DispatchConfig cfg;
  cfg.departureLeadTicks = positiveInt(doc, "departure_lead_ticks", cfg.departureLeadTicks);
  cfg.countdownPeriod = std::chrono::milliseconds(
      positiveInt(doc, "countdown_period_ms", cfg.countdownPeriod.count()));
  cfg.monitorPeriod =
      std::chrono::milliseconds(positiveInt(doc, "monitor_period_ms", cfg.monitorPeriod.count()));

  cfg.readerDevice = stringOr(doc, "reader_device", cfg.readerDevice);
  cfg.readerBaud = static_cast<unsigned int>(positiveInt(doc, "reader_baud", cfg.readerBaud));

  cfg.tagDatabasePath = stringOr(doc, "tag_database_path", cfg.tagDatabasePath);
  cfg.notificationSpoolPath = stringOr(doc, "notification_spool_path", cfg.notificationSpoolPath);
  cfg.logCsvPath = stringOr(doc, "log_csv_path", cfg.logCsvPath);

  const auto level = stringOr(doc, "log_level", toString(cfg.logLevel));
  auto parsed = logLevelFromString(level);
  if (!parsed)
    throw std::invalid_argument("[DispatchConfig] unknown log_level '" + level + "'");
  cfg.logLevel = *parsed;

  return cfg;
}
