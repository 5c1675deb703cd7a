#pragma once
/** @file  TagDatabase.hpp
 *  @brief Tag id -> product record store consulted by the completeness check.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pantheon {
  namespace core {

    struct TagRecord {
      std::string tagId;
      std::string productCode;
      std::string description;

      bool operator==(const TagRecord&) const = default;
    };

    /**
 * @class TagDatabase
 * @brief Abstract tag store (put / get / remove).
 *
 *  Implementations must be safe to call from the dispatch owner thread and
 *  the operator console at the same time.
 */
    class TagDatabase {
    public:
      virtual ~TagDatabase() = default;

      virtual void put(const TagRecord& record) = 0;
      virtual std::optional<TagRecord> get(const std::string& tagId) const = 0;
      /// @returns false if the tag was unknown.
      virtual bool remove(const std::string& tagId) = 0;
    };

    /**
 * @class InMemoryTagDatabase
 * @brief Mutex-protected hash map; optionally seeded from a JSON array file.
 */
    class InMemoryTagDatabase : public TagDatabase {
    public:
      InMemoryTagDatabase() = default;

      void put(const TagRecord& record) override;
      std::optional<TagRecord> get(const std::string& tagId) const override;
      bool remove(const std::string& tagId) override;

      std::size_t size() const;

      /// Loads `[{"tag_id","product_code","description"}]`; returns the number of records added.
      /// Throws std::runtime_error / std::invalid_argument on I/O or schema errors.
      std::size_t seedFromFile(const std::string& path);

    private:
      mutable std::mutex mtx_;
      std::unordered_map<std::string, TagRecord> records_;
    };

  } // namespace core
} // namespace pantheon
