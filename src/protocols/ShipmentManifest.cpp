/* @file ShipmentManifest.cpp
 * @brief shipment document parsing and structural validation
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Third-party headers
#include <nlohmann/json.hpp>

// Pantheon headers
#include "protocols/ShipmentManifest.hpp"

using namespace pantheon::protocols;
using nlohmann::json;

namespace {

  // JSON integer -> quantity, refusing anything an int cannot hold
  int quantityFrom(const json& qty, const std::string& orderId, const std::string& code) {
    const auto where = "[ShipmentManifest] order " + orderId + " product " + code;
    if (!qty.is_number_integer())
      throw std::invalid_argument(where + " quantity is not an integer");
    if (qty.is_number_unsigned()) {
      if (qty.get<std::uint64_t>() > static_cast<std::uint64_t>(ShipmentManifest::kMaxItemCount))
        throw std::invalid_argument(where + " quantity is out of range");
    } else {
      const auto v = qty.get<std::int64_t>();
      if (v <= 0)
        throw std::invalid_argument(where + " has non-positive quantity");
      if (v > ShipmentManifest::kMaxItemCount)
        throw std::invalid_argument(where + " quantity is out of range");
    }
    return static_cast<int>(qty.get<std::int64_t>());
  }

} // namespace

std::map<std::string, std::int64_t> ShipmentManifest::expectedQuantities() const {
  std::map<std::string, std::int64_t> totals;
  for (const auto& [id, order] : orders) {
    for (const auto& [code, qty] : order.items)
      totals[code] += qty;
  }
  return totals;
}

std::int64_t ShipmentManifest::expectedItemCount() const {
  std::int64_t count = 0;
  for (const auto& [code, qty] : expectedQuantities())
    count += qty;
  return count;
}

void ShipmentManifest::validate() const {
  if (shipmentId.empty())
    throw std::invalid_argument("[ShipmentManifest] shipment id is empty");
  if (orders.empty())
    throw std::invalid_argument("[ShipmentManifest] shipment " + shipmentId + " has no orders");

  for (const auto& [id, order] : orders) {
    if (order.items.empty())
      throw std::invalid_argument("[ShipmentManifest] order " + id + " has no items");
    for (const auto& [code, qty] : order.items) {
      if (code.empty())
        throw std::invalid_argument("[ShipmentManifest] order " + id + " has an empty product code");
      if (qty <= 0)
        throw std::invalid_argument("[ShipmentManifest] order " + id + " product " + code +
                                    " has non-positive quantity");
    }
  }

  // each quantity is a positive int, so the int64 sum cannot wrap
  if (expectedItemCount() > kMaxItemCount)
    throw std::invalid_argument("[ShipmentManifest] shipment " + shipmentId + " expects more than " +
                                std::to_string(kMaxItemCount) + " items");
}

ShipmentManifest ShipmentManifest::fromJson(const json& doc) {
  ShipmentManifest manifest;
  try {
    manifest.shipmentId = doc.at("shipment_id").get<std::string>();

    for (const auto& [orderId, body] : doc.at("orders").items()) {
      Order order;
      order.orderId = orderId;

      if (body.contains("customer")) {
        const auto& c = body.at("customer");
        order.customer.name = c.value("name", "");
        order.customer.email = c.value("email", "");
        order.customer.cell = c.value("cell", "");
      }

      for (const auto& [code, qty] : body.at("items").items())
        order.items[code] = quantityFrom(qty, orderId, code);

      manifest.orders.emplace(orderId, std::move(order));
    }
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("[ShipmentManifest] malformed document: ") + e.what());
  }

  manifest.validate();
  return manifest;
}

json ShipmentManifest::toJson() const {
  json orderDocs = json::object();
  for (const auto& [id, order] : orders) {
    orderDocs[id] = { { "customer",
                        { { "name", order.customer.name },
                          { "email", order.customer.email },
                          { "cell", order.customer.cell } } },
                      { "items", order.items } };
  }
  return { { "shipment_id", shipmentId }, { "orders", orderDocs } };
}
