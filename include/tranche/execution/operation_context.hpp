#pragma once

#include <tranche/schema/primitives.hpp>
#include <tranche/schema/transaction_event.hpp>
#include <vector>

namespace tranche::execution {

/// Per-transaction inputs and outputs shared by the vault engines.
struct operation_context final {
  tranche::schema::account_id_t caller{};
  tranche::schema::timestamp_seconds_t now{};
  std::vector<tranche::schema::transaction_event_t> events;
};

}  // namespace tranche::execution
