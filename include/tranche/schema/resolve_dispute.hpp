#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: resolve_dispute.
// Vault workflow: Close the open dispute after its voting window and settle
// stakes, collateral and the lock flag.
namespace tranche::schema {

template <uint16_t Version>
struct resolve_dispute;

template <>
struct resolve_dispute<1> final {
  uint16_t version{1};
};

using resolve_dispute_t = resolve_dispute<1>;

}  // namespace tranche::schema
