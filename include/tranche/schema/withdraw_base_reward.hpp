#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: withdraw_base_reward.
// Vault workflow: Pay out the caller's pending base-asset reward.
namespace tranche::schema {

template <uint16_t Version>
struct withdraw_base_reward;

template <>
struct withdraw_base_reward<1> final {
  uint16_t version{1};
};

using withdraw_base_reward_t = withdraw_base_reward<1>;

}  // namespace tranche::schema
