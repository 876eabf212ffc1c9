#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: withdraw_owed_fees.
// Vault workflow: Collect the caller's pro-rata share of fees accrued since
// its last withdrawal.
namespace tranche::schema {

template <uint16_t Version>
struct withdraw_owed_fees;

template <>
struct withdraw_owed_fees<1> final {
  uint16_t version{1};
};

using withdraw_owed_fees_t = withdraw_owed_fees<1>;

}  // namespace tranche::schema
