#pragma once
/** @file  ShipmentManifest.hpp
 *  @brief Expected goods for one dispatch cycle (fromJson / toJson).
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <string>

// Third-party headers
#include <nlohmann/json_fwd.hpp>

namespace pantheon::protocols {

  struct Customer {
    std::string name;
    std::string email;
    std::string cell;

    bool operator==(const Customer&) const = default;
  };

  struct Order {
    std::string orderId;
    Customer customer;
    std::map<std::string, int> items; ///< product code -> expected quantity

    bool operator==(const Order&) const = default;
  };

  /**
 * @struct ShipmentManifest
 * @brief A shipment document as uploaded by the ERP side.
 *
 *  * Immutable once installed in the dispatch monitor.
 *  * `validate()` is the structural check the intake boundary runs before
 *    handing the manifest to the monitor.
 */
  struct ShipmentManifest {
    /// Upper bound on the summed quantity of a whole shipment.
    static constexpr std::int64_t kMaxItemCount = 1'000'000;

    std::string shipmentId;
    std::map<std::string, Order> orders; ///< keyed by order id

    /// Sum of quantities per product code across all orders.
    std::map<std::string, std::int64_t> expectedQuantities() const;

    /// Total number of tagged items the manifest expects.
    std::int64_t expectedItemCount() const;

    /// Throws std::invalid_argument on an empty id, no orders, a non-positive
    /// quantity or a total above kMaxItemCount.
    void validate() const;

    /// Parses `{"shipment_id", "orders": {id: {"customer", "items"}}}`; throws std::invalid_argument.
    static ShipmentManifest fromJson(const nlohmann::json& doc);
    nlohmann::json toJson() const;

    bool operator==(const ShipmentManifest&) const = default;
  };

} // namespace pantheon::protocols
