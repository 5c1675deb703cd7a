/* @file ConfigLoader.cpp
 * @brief file -> nlohmann::json with [ConfigLoader]-prefixed errors
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// Third-party headers
#include <nlohmann/json.hpp>

// Pantheon headers
#include "core/ConfigLoader.hpp"

using namespace pantheon::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + " is not valid JSON: " + e.what());
  }
}
