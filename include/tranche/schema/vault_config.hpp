#pragma once
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/zero_vote_policy.hpp>
#include <string>

// Schema type: vault config.
// Vault workflow: Construction-time constants. The oracle condition is an
// opaque description and is never interpreted.
namespace tranche::schema {

inline constexpr auto kDefaultFeeDenominator = uint64_t{100};
inline constexpr auto kDefaultInitiationAmountDenominator = uint64_t{4};
inline constexpr auto kDefaultDisputeDuration = duration_seconds_t{604800};

template <uint16_t Version>
struct vault_config;

template <>
struct vault_config<1> final {
  uint16_t version{1};
  account_id_t vault_account{make_account_id("tranche.vault")};
  std::string oracle_condition;
  uint64_t fee_denominator{kDefaultFeeDenominator};
  uint64_t initiation_amount_denominator{kDefaultInitiationAmountDenominator};
  duration_seconds_t dispute_duration{kDefaultDisputeDuration};
  zero_vote_policy_t zero_vote_policy{zero_vote_policy_t::refund_initiator};
};

using vault_config_t = vault_config<1>;

}  // namespace tranche::schema
