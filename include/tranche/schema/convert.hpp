#pragma once
#include <tranche/schema/primitives.hpp>

// Schema type: convert.
// Vault workflow: Deposit base asset and receive the cToken/iToken pair,
// less the issuance fee.
namespace tranche::schema {

template <uint16_t Version>
struct convert;

template <>
struct convert<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using convert_t = convert<1>;

}  // namespace tranche::schema
