#pragma once
#include <tranche/schema/dispute_outcome.hpp>
#include <tranche/schema/primitives.hpp>

// Schema type: resolved dispute.
// Vault workflow: Archive row written when a dispute closes, kept for audit
// after the single dispute slot is reused.
namespace tranche::schema {

template <uint16_t Version>
struct resolved_dispute;

template <>
struct resolved_dispute<1> final {
  uint16_t version{1};
  uint64_t dispute_id{};
  account_id_t initiator{};
  amount_t initiation_amount{};
  timestamp_seconds_t end_time{};
  amount_t accept_weight{};
  amount_t decline_weight{};
  uint64_t vote_count{};
  dispute_outcome_t outcome{};
  timestamp_seconds_t resolved_at{};
};

using resolved_dispute_t = resolved_dispute<1>;

}  // namespace tranche::schema
