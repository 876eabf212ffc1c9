#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: initiate_dispute.
// Vault workflow: Open a dispute, posting a share of the iToken supply as
// base-asset collateral.
namespace tranche::schema {

template <uint16_t Version>
struct initiate_dispute;

template <>
struct initiate_dispute<1> final {
  uint16_t version{1};
};

using initiate_dispute_t = initiate_dispute<1>;

}  // namespace tranche::schema
