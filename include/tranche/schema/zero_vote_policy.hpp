#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: zero vote policy.
// Vault workflow: How resolve_dispute treats a dispute that received no
// votes at all (both weights zero).
namespace tranche::schema {

enum class zero_vote_policy_t : uint8_t {
  // Fail with no_votes_cast; the dispute stays open.
  reject = 0,
  // Return the collateral to the initiator and close; lock flag unchanged.
  refund_initiator = 1
};

inline constexpr auto kZeroVotePolicyMappings = std::array{
    std::pair<std::string_view, zero_vote_policy_t>{
        "reject", zero_vote_policy_t::reject},
    std::pair<std::string_view, zero_vote_policy_t>{
        "refund_initiator", zero_vote_policy_t::refund_initiator}};

template <>
inline std::optional<zero_vote_policy_t> try_from_string<zero_vote_policy_t>(
    const std::string_view value) {
  return from_string(value, kZeroVotePolicyMappings);
}

inline constexpr std::string_view to_string(const zero_vote_policy_t value) {
  return to_string(value, kZeroVotePolicyMappings).value_or("unknown");
}

}  // namespace tranche::schema
