#pragma once
#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/primitives.hpp>

namespace tranche::schema {

template <uint16_t Version>
struct genesis_allocation;

/// Initial balance of an external asset (base or governance).
template <>
struct genesis_allocation<1> final {
  uint16_t version{1};
  asset_kind_t asset{};
  account_id_t account{};
  amount_t amount{};
};

using genesis_allocation_t = genesis_allocation<1>;

}  // namespace tranche::schema
