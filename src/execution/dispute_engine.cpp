#include <spdlog/spdlog.h>
#include <tranche/execution/arithmetic.hpp>
#include <tranche/execution/dispute_engine.hpp>
#include <tranche/execution/events.hpp>
#include <tranche/execution/fee_ledger.hpp>

using namespace tranche::schema;

namespace tranche::execution {

tranche::token::status_t dispute_engine::initiate(operation_context& context) {
  auto& vault = state_.vault;
  if (current_phase(vault) == dispute_phase_t::open) {
    return transaction_error_code::dispute_already_open;
  }

  auto initiation_amount =
      amount_t{state_.i_token.total_supply() /
               state_.config.initiation_amount_denominator};
  vault.dispute = dispute_t{
      .dispute_id = vault.dispute_count + 1,
      .initiator = context.caller,
      .initiation_amount = initiation_amount,
      .end_time = context.now + state_.config.dispute_duration,
      .open = true};
  vault.dispute_count += 1;
  vault.votes.clear();

  // The slot is already open here, so a nested initiate sees
  // dispute_already_open.
  const auto& vault_account = state_.vault_account();
  if (auto status = state_.base_asset.transfer_from(
          vault_account, context.caller, vault_account, initiation_amount)) {
    return status;
  }

  spdlog::info("Dispute {} opened by {} with collateral {}, voting ends at {}",
               vault.dispute->dispute_id, to_hex(context.caller),
               to_string(initiation_amount), vault.dispute->end_time);
  context.events.push_back(
      event_builder{kInitiateDisputeEvent}
          .number("dispute_id", vault.dispute->dispute_id, true)
          .account("initiator", context.caller)
          .amount("initiation_amount", initiation_amount)
          .number("end_time", vault.dispute->end_time)
          .build());
  return std::nullopt;
}

tranche::token::status_t dispute_engine::vote(operation_context& context,
                                              vote_side_t side,
                                              const amount_t& weight) {
  if (weight == 0) {
    return transaction_error_code::invalid_amount;
  }
  auto& vault = state_.vault;
  if (current_phase(vault) != dispute_phase_t::open) {
    return transaction_error_code::dispute_not_open;
  }
  auto& dispute = *vault.dispute;
  if (context.now > dispute.end_time) {
    return transaction_error_code::voting_closed;
  }

  auto& side_weight = side == vote_side_t::accept ? dispute.accept_weight
                                                  : dispute.decline_weight;
  // Stakes are bounded by governance supply, so the sum cannot overflow.
  const auto& vault_account = state_.vault_account();
  if (auto status = state_.governance_asset.transfer_from(
          vault_account, context.caller, vault_account, weight)) {
    return status;
  }
  vault.votes.push_back(
      vote_record_t{.voter = context.caller, .side = side, .weight = weight});
  side_weight += weight;

  context.events.push_back(event_builder{kVoteEvent}
                               .number("dispute_id", dispute.dispute_id, true)
                               .account("voter", context.caller)
                               .text("side", std::string{to_string(side)})
                               .amount("weight", weight)
                               .build());
  return std::nullopt;
}

tranche::token::status_t dispute_engine::resolve(operation_context& context) {
  auto& vault = state_.vault;
  if (current_phase(vault) != dispute_phase_t::open) {
    return transaction_error_code::dispute_not_open;
  }
  const auto dispute = *vault.dispute;
  if (context.now <= dispute.end_time) {
    return transaction_error_code::voting_still_active;
  }

  auto outcome = dispute_outcome_t::declined;
  if (dispute.accept_weight == 0 && dispute.decline_weight == 0) {
    if (state_.config.zero_vote_policy == zero_vote_policy_t::reject) {
      return transaction_error_code::no_votes_cast;
    }
    outcome = dispute_outcome_t::no_votes;
    if (auto status = state_.base_asset.transfer(
            state_.vault_account(), dispute.initiator,
            dispute.initiation_amount)) {
      return status;
    }
  } else if (dispute.accept_weight > dispute.decline_weight) {
    outcome = dispute_outcome_t::accepted;
    if (auto status = settle_accepted(dispute)) {
      return status;
    }
    vault.locked = false;
  } else if (auto status = settle_declined(dispute)) {
    return status;
  }

  vault.dispute->open = false;
  archive(dispute, outcome, context.now);

  spdlog::info("Dispute {} resolved: {} (accept {}, decline {}), locked={}",
               dispute.dispute_id, to_string(outcome),
               to_string(dispute.accept_weight),
               to_string(dispute.decline_weight), vault.locked);
  context.events.push_back(
      event_builder{kResolveDisputeEvent}
          .number("dispute_id", dispute.dispute_id, true)
          .text("outcome", std::string{to_string(outcome)}, true)
          .amount("accept_weight", dispute.accept_weight)
          .amount("decline_weight", dispute.decline_weight)
          .flag("locked", vault.locked)
          .build());
  return std::nullopt;
}

tranche::token::status_t dispute_engine::settle_accepted(
    const dispute_t& dispute) {
  if (auto status = state_.base_asset.transfer(state_.vault_account(),
                                               dispute.initiator,
                                               dispute.initiation_amount)) {
    return status;
  }
  auto fees = fee_ledger{state_};
  for (const auto& vote : state_.vault.votes) {
    if (vote.side != vote_side_t::accept) {
      continue;
    }
    auto reward = amount_t{vote.weight + mul_div(dispute.decline_weight,
                                                 vote.weight,
                                                 dispute.accept_weight)};
    if (auto status = fees.credit_governance_reward(vote.voter, reward)) {
      return status;
    }
  }
  return std::nullopt;
}

tranche::token::status_t dispute_engine::settle_declined(
    const dispute_t& dispute) {
  auto fees = fee_ledger{state_};
  for (const auto& vote : state_.vault.votes) {
    if (vote.side != vote_side_t::decline) {
      continue;
    }
    auto governance_reward =
        amount_t{vote.weight + mul_div(dispute.accept_weight, vote.weight,
                                       dispute.decline_weight)};
    auto base_reward = mul_div(dispute.initiation_amount, vote.weight,
                               dispute.decline_weight);
    if (auto status =
            fees.credit_governance_reward(vote.voter, governance_reward)) {
      return status;
    }
    if (auto status = fees.credit_base_reward(vote.voter, base_reward)) {
      return status;
    }
  }
  return std::nullopt;
}

void dispute_engine::archive(const dispute_t& dispute,
                             dispute_outcome_t outcome,
                             timestamp_seconds_t now) {
  state_.vault.resolved_disputes.push_back(resolved_dispute_t{
      .dispute_id = dispute.dispute_id,
      .initiator = dispute.initiator,
      .initiation_amount = dispute.initiation_amount,
      .end_time = dispute.end_time,
      .accept_weight = dispute.accept_weight,
      .decline_weight = dispute.decline_weight,
      .vote_count = state_.vault.votes.size(),
      .outcome = outcome,
      .resolved_at = now});
}

}  // namespace tranche::execution
