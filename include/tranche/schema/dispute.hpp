#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: dispute.
// Vault workflow: The single active proposal that the oracle condition has
// occurred, with collateral posted by the initiator and accumulated weights.
namespace tranche::schema {

template <uint16_t Version>
struct dispute;

template <>
struct dispute<1> final {
  uint16_t version{1};
  uint64_t dispute_id{};
  account_id_t initiator{};
  amount_t initiation_amount{};
  timestamp_seconds_t end_time{};
  amount_t accept_weight{};
  amount_t decline_weight{};
  bool open{};
};

using dispute_t = dispute<1>;

}  // namespace tranche::schema
