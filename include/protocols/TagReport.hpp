#pragma once
/** @file  TagReport.hpp
 *  @brief Line-framed tag report emitted by the RFID reader (fromWire).
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <optional>
#include <set>
#include <string>

namespace pantheon {
  namespace protocols {

    /// Unique, order-irrelevant collection of tag identifiers (EPCs).
    using TagSet = std::set<std::string>;

    /**
 * @struct TagReport
 * @brief One decoded reader report: the EPCs seen since the previous report.
 *
 *  * Wire format: hex EPCs separated by ',' and/or whitespace, CRLF stripped.
 *  * EPCs are upper-cased; duplicates inside a report collapse.
 */
    struct TagReport {
      TagSet tags;

      /// Returns std::nullopt if any token is not a hexadecimal EPC.
      static std::optional<TagReport> fromWire(const std::string& line);

      std::string toWire() const;
    };

  } // namespace protocols
} // namespace pantheon
