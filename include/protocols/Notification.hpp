#pragma once
/** @file  Notification.hpp
 *  @brief Outbound dispatch notifications (toWire as one JSON line).
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Pantheon headers
#include "protocols/ShipmentManifest.hpp"
#include "protocols/TagReport.hpp"

namespace pantheon {
  namespace protocols {

    enum class NotificationKind : std::uint8_t { MissingTags, ExtraTags, ShipmentComplete };

    inline const char* toString(NotificationKind k) {
      switch (k) {
      case NotificationKind::MissingTags:
        return "missing-tags";
      case NotificationKind::ExtraTags:
        return "extra-tags";
      case NotificationKind::ShipmentComplete:
        return "shipment-complete";
      default:
        return "unknown";
      }
    }

    /**
 * @struct Notification
 * @brief Typed message plus the cycle snapshot it was raised from.
 *
 *  Delivery (SMS / e-mail relay) is somebody else's job; the monitor only
 *  hands these to an io::NotificationSink and moves on.
 */
    struct Notification {
      NotificationKind kind{ NotificationKind::ExtraTags };
      std::optional<ShipmentManifest> manifest;
      TagSet tagsRead;
      std::chrono::system_clock::time_point raisedAt{ std::chrono::system_clock::now() };

      /// Single JSON document terminated by '\n'.
      std::string toWire() const;
    };

  } // namespace protocols
} // namespace pantheon
