#pragma once
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/vote_side.hpp>

// Schema type: cast vote.
// Vault workflow: Lock governance asset as stake on one side of the open
// dispute. Repeated votes add further stake.
namespace tranche::schema {

template <uint16_t Version>
struct cast_vote;

template <>
struct cast_vote<1> final {
  uint16_t version{1};
  vote_side_t side{};
  amount_t weight{};
};

using cast_vote_t = cast_vote<1>;

}  // namespace tranche::schema
