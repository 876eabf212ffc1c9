#pragma once
#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/primitives.hpp>

// Schema type: approve asset.
// Vault workflow: Set the allowance the vault account draws on for convert,
// initiate_dispute and cast_vote. Replaces any previous allowance.
namespace tranche::schema {

template <uint16_t Version>
struct approve_asset;

template <>
struct approve_asset<1> final {
  uint16_t version{1};
  asset_kind_t asset{};
  account_id_t spender{};
  amount_t amount{};
};

using approve_asset_t = approve_asset<1>;

}  // namespace tranche::schema
