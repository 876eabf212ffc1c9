#include <spdlog/spdlog.h>
#include <tranche/execution/arithmetic.hpp>
#include <tranche/execution/events.hpp>
#include <tranche/execution/fee_ledger.hpp>

using namespace tranche::schema;

namespace tranche::execution {

namespace {

amount_t lookup(const amount_by_account_t& balances,
                const account_id_t& account) {
  auto found = balances.find(account);
  return found == std::end(balances) ? amount_t{} : found->second;
}

tranche::token::status_t credit(amount_by_account_t& balances,
                                const account_id_t& account,
                                const amount_t& amount) {
  auto updated = checked_add(lookup(balances, account), amount);
  if (!updated) {
    return transaction_error_code::amount_overflow;
  }
  if (*updated != 0) {
    balances[account] = *updated;
  }
  return std::nullopt;
}

}  // namespace

owed_fees_t owed_fees(const world_state& state, const account_id_t& account) {
  auto result = owed_fees_t{};
  const auto& vault = state.vault;
  result.new_fees =
      vault.accrued_fees -
      lookup(vault.accrued_fees_at_last_withdrawal, account);

  const auto& supply = state.governance_asset.total_supply();
  if (result.new_fees == 0 || supply == 0) {
    return result;
  }
  result.share = mul_div(result.new_fees,
                         state.governance_asset.balance_of(account), supply);
  return result;
}

tranche::token::status_t fee_ledger::accrue(const amount_t& fee) {
  auto accrued = checked_add(state_.vault.accrued_fees, fee);
  if (!accrued) {
    return transaction_error_code::amount_overflow;
  }
  state_.vault.accrued_fees = *accrued;
  // remaining <= accrued, so this cannot overflow once accrued did not.
  state_.vault.remaining_fees += fee;
  return std::nullopt;
}

tranche::token::status_t fee_ledger::credit_governance_reward(
    const account_id_t& account,
    const amount_t& amount) {
  return credit(state_.vault.governance_token_rewards, account, amount);
}

tranche::token::status_t fee_ledger::credit_base_reward(
    const account_id_t& account,
    const amount_t& amount) {
  return credit(state_.vault.base_token_rewards, account, amount);
}

tranche::token::status_t fee_ledger::withdraw_owed_fees(
    operation_context& context) {
  auto owed = owed_fees(state_, context.caller);
  if (owed.new_fees == 0 || owed.share == 0) {
    return transaction_error_code::no_fees_owed;
  }

  auto& vault = state_.vault;
  // Balances moved between snapshots can push the summed shares past what
  // is held; the payout never draws on backing or reward funds.
  auto payout = owed.share;
  if (payout > vault.remaining_fees) {
    spdlog::warn("Capping fee share {} for {} at remaining fees {}",
                 to_string(payout), to_hex(context.caller),
                 to_string(vault.remaining_fees));
    payout = vault.remaining_fees;
  }
  if (payout == 0) {
    return transaction_error_code::no_fees_owed;
  }

  // The snapshot advances past the whole share, so a capped remainder is
  // forfeited; the event reports it.
  auto forfeited = amount_t{owed.share - payout};
  vault.remaining_fees -= payout;
  vault.accrued_fees_at_last_withdrawal[context.caller] = vault.accrued_fees;
  if (auto status = state_.base_asset.transfer(state_.vault_account(),
                                               context.caller, payout)) {
    return status;
  }

  context.events.push_back(event_builder{kWithdrawOwedFeesEvent}
                               .account("account", context.caller)
                               .amount("amount", payout)
                               .amount("remaining_fees", vault.remaining_fees)
                               .amount("forfeited", forfeited)
                               .build());
  return std::nullopt;
}

tranche::token::status_t fee_ledger::withdraw_governance_reward(
    operation_context& context) {
  auto& rewards = state_.vault.governance_token_rewards;
  auto pending = lookup(rewards, context.caller);
  if (pending == 0) {
    return transaction_error_code::no_reward_owed;
  }
  rewards.erase(context.caller);
  if (auto status = state_.governance_asset.transfer(
          state_.vault_account(), context.caller, pending)) {
    return status;
  }
  context.events.push_back(event_builder{kWithdrawGovernanceRewardEvent}
                               .account("account", context.caller)
                               .amount("amount", pending)
                               .build());
  return std::nullopt;
}

tranche::token::status_t fee_ledger::withdraw_base_reward(
    operation_context& context) {
  auto& rewards = state_.vault.base_token_rewards;
  auto pending = lookup(rewards, context.caller);
  if (pending == 0) {
    return transaction_error_code::no_reward_owed;
  }
  rewards.erase(context.caller);
  if (auto status = state_.base_asset.transfer(state_.vault_account(),
                                               context.caller, pending)) {
    return status;
  }
  context.events.push_back(event_builder{kWithdrawBaseRewardEvent}
                               .account("account", context.caller)
                               .amount("amount", pending)
                               .build());
  return std::nullopt;
}

}  // namespace tranche::execution
