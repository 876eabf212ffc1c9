#pragma once

#include <tranche/execution/operation_context.hpp>
#include <tranche/execution/world_state.hpp>
#include <tranche/schema/dispute_outcome.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/vote_side.hpp>
#include <tranche/token/ledger.hpp>

namespace tranche::execution {

/// Dispute state machine: closed -> open (initiate) -> closed (resolve).
///
/// Collateral is posted in base asset and stakes in governance asset, both
/// pulled into vault custody through allowances granted to the vault account.
class dispute_engine final {
 public:
  explicit dispute_engine(world_state& state) : state_{state} {}

  /// Open a dispute claiming the oracle condition occurred.
  ///
  /// Collateral is iToken supply / initiation_amount_denominator.
  tranche::token::status_t initiate(operation_context& context);

  /// Stake `weight` governance asset on `side` of the open dispute.
  tranche::token::status_t vote(operation_context& context,
                                tranche::schema::vote_side_t side,
                                const tranche::schema::amount_t& weight);

  /// Close the dispute once voting has ended and credit the winning side.
  tranche::token::status_t resolve(operation_context& context);

 private:
  tranche::token::status_t settle_accepted(
      const tranche::schema::dispute_t& dispute);
  tranche::token::status_t settle_declined(
      const tranche::schema::dispute_t& dispute);
  void archive(const tranche::schema::dispute_t& dispute,
               tranche::schema::dispute_outcome_t outcome,
               tranche::schema::timestamp_seconds_t now);

  world_state& state_;
};

}  // namespace tranche::execution
