#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: redeem.
// Vault workflow: Burn claim tokens for base asset; burns both tokens while
// locked and only iToken once unlocked.
namespace tranche::schema {

template <uint16_t Version>
struct redeem;

template <>
struct redeem<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using redeem_t = redeem<1>;

}  // namespace tranche::schema
