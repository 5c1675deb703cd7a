/* @file TagDatabase.cpp
 * @brief in-memory tag store with JSON seed loading
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Third-party headers
#include <nlohmann/json.hpp>

// Pantheon headers
#include "core/ConfigLoader.hpp"
#include "core/TagDatabase.hpp"

using namespace pantheon::core;

void InMemoryTagDatabase::put(const TagRecord& record) {
  if (record.tagId.empty())
    throw std::invalid_argument("[TagDatabase] tag id is empty");
  std::lock_guard<std::mutex> lk(mtx_);
  records_[record.tagId] = record;
}

std::optional<TagRecord> InMemoryTagDatabase::get(const std::string& tagId) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = records_.find(tagId);
  if (it == records_.end())
    return std::nullopt;
  return it->second;
}

bool InMemoryTagDatabase::remove(const std::string& tagId) {
  std::lock_guard<std::mutex> lk(mtx_);
  return records_.erase(tagId) > 0;
}

std::size_t InMemoryTagDatabase::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return records_.size();
}

std::size_t InMemoryTagDatabase::seedFromFile(const std::string& path) {
  const nlohmann::json doc = ConfigLoader(path).load();
  if (!doc.is_array())
    throw std::invalid_argument("[TagDatabase] seed file " + path + " is not a JSON array");

  std::size_t added = 0;
  for (const auto& entry : doc) {
    try {
      put(TagRecord{ entry.at("tag_id").get<std::string>(),
                     entry.at("product_code").get<std::string>(),
                     entry.value("description", "") });
    } catch (const nlohmann::json::exception& e) {
      throw std::invalid_argument("[TagDatabase] bad record in " + path + ": " + e.what());
    }
    ++added;
  }
  return added;
}
