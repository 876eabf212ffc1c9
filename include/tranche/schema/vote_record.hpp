#pragma once
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/vote_side.hpp>

namespace tranche::schema {

template <uint16_t Version>
struct vote_record;

template <>
struct vote_record<1> final {
  uint16_t version{1};
  account_id_t voter{};
  vote_side_t side{};
  amount_t weight{};
};

using vote_record_t = vote_record<1>;

}  // namespace tranche::schema
