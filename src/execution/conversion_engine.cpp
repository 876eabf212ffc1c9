#include <spdlog/spdlog.h>
#include <tranche/execution/conversion_engine.hpp>
#include <tranche/execution/events.hpp>
#include <tranche/execution/fee_ledger.hpp>

using namespace tranche::schema;

namespace tranche::execution {

tranche::token::status_t conversion_engine::convert(
    operation_context& context,
    const amount_t& amount) {
  if (amount == 0) {
    return transaction_error_code::invalid_amount;
  }

  const auto& vault_account = state_.vault_account();
  if (auto status = state_.base_asset.transfer_from(
          vault_account, context.caller, vault_account, amount)) {
    return status;
  }

  auto fee = amount_t{amount / state_.config.fee_denominator};
  auto minted = amount_t{amount - fee};
  if (auto status = fee_ledger{state_}.accrue(fee)) {
    return status;
  }
  if (auto status = state_.c_token.mint(vault_account, context.caller, minted)) {
    return status;
  }
  if (auto status = state_.i_token.mint(vault_account, context.caller, minted)) {
    return status;
  }

  spdlog::debug("convert: {} deposited {}, fee {}", to_hex(context.caller),
                to_string(amount), to_string(fee));
  context.events.push_back(event_builder{kConvertEvent}
                               .account("caller", context.caller)
                               .amount("amount", amount)
                               .amount("fee", fee)
                               .amount("minted", minted)
                               .build());
  return std::nullopt;
}

tranche::token::status_t conversion_engine::redeem(operation_context& context,
                                                   const amount_t& amount) {
  if (amount == 0) {
    return transaction_error_code::invalid_amount;
  }

  const auto& vault_account = state_.vault_account();
  const auto locked = state_.vault.locked;
  if (state_.i_token.balance_of(context.caller) < amount ||
      (locked && state_.c_token.balance_of(context.caller) < amount)) {
    return transaction_error_code::insufficient_balance;
  }

  if (locked) {
    if (auto status = state_.c_token.burn(vault_account, context.caller,
                                          amount)) {
      return status;
    }
  }
  if (auto status = state_.i_token.burn(vault_account, context.caller, amount)) {
    return status;
  }
  if (auto status =
          state_.base_asset.transfer(vault_account, context.caller, amount)) {
    return status;
  }

  context.events.push_back(event_builder{kRedeemEvent}
                               .account("caller", context.caller)
                               .amount("amount", amount)
                               .flag("locked", locked)
                               .build());
  return std::nullopt;
}

}  // namespace tranche::execution
