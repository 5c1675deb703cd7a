#include "core/ConfigLoader.hpp"
#include "core/DispatchConfig.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace pantheon::core;
using nlohmann::json;
namespace fs = std::filesystem;

TEST(dispatch_config, defaults_for_empty_object) {
  auto cfg = DispatchConfig::fromJson(json::object());
  EXPECT_EQ(cfg.departureLeadTicks, 600);
  EXPECT_EQ(cfg.countdownPeriod, std::chrono::milliseconds{ 1000 });
  EXPECT_EQ(cfg.monitorPeriod, std::chrono::milliseconds{ 1000 });
  EXPECT_EQ(cfg.readerDevice, "/dev/rfid0");
  EXPECT_EQ(cfg.readerBaud, 115200u);
  EXPECT_EQ(cfg.tagDatabasePath, "");
  EXPECT_EQ(cfg.notificationSpoolPath, "pantheon-notifications.jsonl");
  EXPECT_EQ(cfg.logCsvPath, "");
  EXPECT_EQ(cfg.logLevel, LogLevel::Info);
}

TEST(dispatch_config, overrides) {
  auto cfg = DispatchConfig::fromJson(json{ { "departure_lead_ticks", 30 },
                                            { "countdown_period_ms", 250 },
                                            { "monitor_period_ms", 500 },
                                            { "reader_device", "/dev/ttyUSB0" },
                                            { "reader_baud", 9600 },
                                            { "tag_database_path", "tags.json" },
                                            { "notification_spool_path", "/var/spool/p.jsonl" },
                                            { "log_csv_path", "run.csv" },
                                            { "log_level", "debug" } });
  EXPECT_EQ(cfg.departureLeadTicks, 30);
  EXPECT_EQ(cfg.countdownPeriod, std::chrono::milliseconds{ 250 });
  EXPECT_EQ(cfg.monitorPeriod, std::chrono::milliseconds{ 500 });
  EXPECT_EQ(cfg.readerDevice, "/dev/ttyUSB0");
  EXPECT_EQ(cfg.readerBaud, 9600u);
  EXPECT_EQ(cfg.tagDatabasePath, "tags.json");
  EXPECT_EQ(cfg.notificationSpoolPath, "/var/spool/p.jsonl");
  EXPECT_EQ(cfg.logCsvPath, "run.csv");
  EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
}

TEST(dispatch_config, rejects_bad_values) {
  EXPECT_THROW(DispatchConfig::fromJson(json::array()), std::invalid_argument);
  EXPECT_THROW(DispatchConfig::fromJson(json{ { "departure_lead_ticks", 0 } }),
               std::invalid_argument);
  EXPECT_THROW(DispatchConfig::fromJson(json{ { "monitor_period_ms", -5 } }),
               std::invalid_argument);
  EXPECT_THROW(DispatchConfig::fromJson(json{ { "countdown_period_ms", 1.5 } }),
               std::invalid_argument);
  EXPECT_THROW(DispatchConfig::fromJson(json{ { "reader_baud", "fast" } }),
               std::invalid_argument);
  EXPECT_THROW(DispatchConfig::fromJson(json{ { "reader_device", 7 } }), std::invalid_argument);
  EXPECT_THROW(DispatchConfig::fromJson(json{ { "log_level", "chatty" } }),
               std::invalid_argument);
}

TEST(config_loader, loads_and_reports_errors) {
  const auto path = fs::temp_directory_path() /
                    ("pantheon_cfg_" + std::to_string(::getpid()) + ".json");
  {
    std::ofstream out(path);
    out << R"({"departure_lead_ticks": 45})";
  }

  ConfigLoader loader(path.string());
  EXPECT_EQ(loader.path(), path.string());
  EXPECT_EQ(DispatchConfig::fromJson(loader.load()).departureLeadTicks, 45);

  {
    std::ofstream out(path);
    out << "{ broken";
  }
  EXPECT_THROW(loader.load(), std::runtime_error);

  fs::remove(path);
  EXPECT_THROW(loader.load(), std::runtime_error);
}
