#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: withdraw_governance_reward.
// Vault workflow: Pay out the caller's pending governance-asset reward.
namespace tranche::schema {

template <uint16_t Version>
struct withdraw_governance_reward;

template <>
struct withdraw_governance_reward<1> final {
  uint16_t version{1};
};

using withdraw_governance_reward_t = withdraw_governance_reward<1>;

}  // namespace tranche::schema
