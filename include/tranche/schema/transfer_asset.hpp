#pragma once
#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/primitives.hpp>

namespace tranche::schema {

template <uint16_t Version>
struct transfer_asset;

template <>
struct transfer_asset<1> final {
  uint16_t version{1};
  asset_kind_t asset{};
  account_id_t to{};
  amount_t amount{};
};

using transfer_asset_t = transfer_asset<1>;

}  // namespace tranche::schema
