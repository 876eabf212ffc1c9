#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: dispute outcome.
// Vault workflow: Result recorded when a dispute closes. `no_votes` is only
// produced under the refund_initiator zero-vote policy.
namespace tranche::schema {

enum class dispute_outcome_t : uint8_t {
  accepted = 0,
  declined = 1,
  no_votes = 2
};

inline constexpr auto kDisputeOutcomeMappings = std::array{
    std::pair<std::string_view, dispute_outcome_t>{
        "accepted", dispute_outcome_t::accepted},
    std::pair<std::string_view, dispute_outcome_t>{
        "declined", dispute_outcome_t::declined},
    std::pair<std::string_view, dispute_outcome_t>{
        "no_votes", dispute_outcome_t::no_votes}};

template <>
inline std::optional<dispute_outcome_t> try_from_string<dispute_outcome_t>(
    const std::string_view value) {
  return from_string(value, kDisputeOutcomeMappings);
}

inline constexpr std::string_view to_string(const dispute_outcome_t value) {
  return to_string(value, kDisputeOutcomeMappings).value_or("unknown");
}

}  // namespace tranche::schema
