#pragma once

#include <tranche/execution/operation_context.hpp>
#include <tranche/execution/world_state.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/token/ledger.hpp>

namespace tranche::execution {

/// Issues and retires the cToken/iToken pair against base asset custody.
class conversion_engine final {
 public:
  explicit conversion_engine(world_state& state) : state_{state} {}

  /// Deposit `amount` base asset (pre-approved to the vault account) and mint
  /// `amount - fee` of both claim tokens to the caller.
  tranche::token::status_t convert(operation_context& context,
                                   const tranche::schema::amount_t& amount);

  /// Burn claim tokens for `amount` base asset.
  ///
  /// While locked a matched pair is burned; once unlocked only iToken is.
  tranche::token::status_t redeem(operation_context& context,
                                  const tranche::schema::amount_t& amount);

 private:
  world_state& state_;
};

}  // namespace tranche::execution
