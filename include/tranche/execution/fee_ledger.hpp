#pragma once

#include <tranche/execution/operation_context.hpp>
#include <tranche/execution/world_state.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/token/ledger.hpp>

namespace tranche::execution {

struct owed_fees_t final {
  // Fees accrued since the account's last withdrawal snapshot.
  tranche::schema::amount_t new_fees{};
  // Pro-rata share by current governance balance.
  tranche::schema::amount_t share{};
};

/// Fee shares owed to `account` as of `state`.
///
/// The share uses the governance balance at query time, not the balance
/// held while the fees accrued.
owed_fees_t owed_fees(const world_state& state,
                      const tranche::schema::account_id_t& account);

/// Fee accrual, fee withdrawal and the two pending-reward balances.
///
/// Operates on a world state owned by the caller; the caller discards the
/// state when an operation returns an error.
class fee_ledger final {
 public:
  explicit fee_ledger(world_state& state) : state_{state} {}

  /// Add a collected issuance fee to both running totals.
  tranche::token::status_t accrue(const tranche::schema::amount_t& fee);

  tranche::token::status_t credit_governance_reward(
      const tranche::schema::account_id_t& account,
      const tranche::schema::amount_t& amount);

  tranche::token::status_t credit_base_reward(
      const tranche::schema::account_id_t& account,
      const tranche::schema::amount_t& amount);

  tranche::token::status_t withdraw_owed_fees(operation_context& context);
  tranche::token::status_t withdraw_governance_reward(
      operation_context& context);
  tranche::token::status_t withdraw_base_reward(operation_context& context);

 private:
  world_state& state_;
};

}  // namespace tranche::execution
