/* @file StatusReport.cpp
 * @brief snapshot -> JSON for the status query boundary
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <nlohmann/json.hpp>

#include "core/MonitorState.hpp"
#include "protocols/StatusReport.hpp"

namespace pantheon::protocols {

  nlohmann::json toJson(const core::MonitorSnapshot& snap) {
    nlohmann::json doc{ { "state", core::toString(snap.state) },
                        { "countdown",
                          { { "starting", snap.timer.startingValue },
                            { "current", snap.timer.currentValue },
                            { "period_ms", snap.timer.period.count() },
                            { "running", snap.timer.running } } },
                        { "recoveries", snap.recoveries } };

    if (snap.manifest) {
      doc["shipment_id"] = snap.manifest->shipmentId;
      doc["manifest"] = snap.manifest->toJson();
    } else {
      doc["shipment_id"] = nullptr;
      doc["manifest"] = nullptr;
    }

    if (snap.tagsRead)
      doc["tags_read"] = *snap.tagsRead;
    else
      doc["tags_read"] = nullptr;

    if (snap.lastOutcome)
      doc["last_outcome"] = core::toString(*snap.lastOutcome);
    else
      doc["last_outcome"] = nullptr;

    return doc;
  }

} // namespace pantheon::protocols
