#pragma once
#include <tranche/schema/dispute.hpp>
#include <tranche/schema/dispute_phase.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/resolved_dispute.hpp>
#include <tranche/schema/vote_record.hpp>
#include <map>
#include <optional>
#include <vector>

// Schema type: vault state.
// Vault workflow: Everything the vault owns besides the token ledgers: the
// lock flag, fee accounting, the dispute slot with its votes, and pending
// rewards per account.
namespace tranche::schema {

using amount_by_account_t = std::map<account_id_t, amount_t>;

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  // true until an accepted dispute confirms the oracle condition.
  bool locked{true};
  amount_t accrued_fees{};
  amount_t remaining_fees{};
  amount_by_account_t accrued_fees_at_last_withdrawal;
  amount_by_account_t base_token_rewards;
  amount_by_account_t governance_token_rewards;
  std::optional<dispute_t> dispute;
  std::vector<vote_record_t> votes;
  uint64_t dispute_count{};
  std::vector<resolved_dispute_t> resolved_disputes;
};

using vault_state_t = vault_state<1>;

inline dispute_phase_t current_phase(const vault_state_t& state) {
  return state.dispute.has_value() && state.dispute->open
             ? dispute_phase_t::open
             : dispute_phase_t::closed;
}

}  // namespace tranche::schema
