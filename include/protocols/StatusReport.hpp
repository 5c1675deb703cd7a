#pragma once
/** @file  StatusReport.hpp
 *  @brief JSON rendering of a dispatch monitor snapshot for status queries.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <nlohmann/json_fwd.hpp>

namespace pantheon::core { // forward decls only
  struct MonitorSnapshot;
} // namespace pantheon::core

namespace pantheon::protocols {

  /// `{"state", "shipment_id", "manifest", "tags_read", "countdown", "last_outcome", "recoveries"}`
  nlohmann::json toJson(const core::MonitorSnapshot& snap);

} // namespace pantheon::protocols
