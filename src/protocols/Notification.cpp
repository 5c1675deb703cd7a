/* @file Notification.cpp
 * @brief JSON-lines encoding for the notification spool
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// Third-party headers
#include <nlohmann/json.hpp>

// Pantheon headers
#include "protocols/Notification.hpp"

using namespace pantheon::protocols;

std::string Notification::toWire() const {
  const auto epochMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(raisedAt.time_since_epoch()).count();

  nlohmann::json doc{ { "type", toString(kind) },
                      { "raised_at_ms", epochMs },
                      { "tags_read", tagsRead } };

  if (manifest) {
    doc["shipment_id"] = manifest->shipmentId;
    doc["manifest"] = manifest->toJson();
  } else {
    doc["shipment_id"] = nullptr;
    doc["manifest"] = nullptr;
  }

  return doc.dump() + "\n";
}
