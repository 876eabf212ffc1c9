#pragma once

#include <tranche/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Vault workflow: Domain event emitted by a successful operation (convert,
// redeem, initiate_dispute, vote, resolve_dispute, withdrawals, transfers).
namespace tranche::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;

  std::optional<std::string> attribute(const std::string_view key) const {
    for (const auto& entry : attributes) {
      if (entry.key == key) {
        return entry.value;
      }
    }
    return std::nullopt;
  }
};

using transaction_event_t = transaction_event<1>;

}  // namespace tranche::schema
