#pragma once

#include <gtest/gtest.h>

#include <tranche/execution/engine.hpp>
#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/transaction.hpp>
#include <tranche/schema/transaction_error_code.hpp>
#include <tranche/schema/vote_side.hpp>
#include <tranche/testing/common.hpp>

#include <cstdint>
#include <vector>

namespace tranche::testing {

inline tranche::schema::transaction_t make_transaction(
    const tranche::schema::account_id_t& signer,
    const tranche::schema::transaction_payload_t& payload) {
  return tranche::schema::transaction_t{
      .version = 1, .signer = signer, .payload = payload};
}

inline uint32_t code_of(const tranche::schema::transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

/// Execute `tx` alone in a block and commit it.
inline tranche::schema::transaction_result_t finalize_single(
    tranche::execution::engine& engine,
    const uint64_t height,
    const tranche::schema::timestamp_seconds_t block_time,
    const tranche::schema::transaction_t& tx) {
  auto block = engine.finalize_block(
      height, block_time, std::vector<tranche::schema::transaction_t>{tx});
  EXPECT_EQ(block.tx_results.size(), 1u);
  engine.commit();
  if (block.tx_results.empty()) {
    return tranche::schema::transaction_result_t{};
  }
  return block.tx_results.front();
}

inline tranche::schema::amount_t sum_amounts(
    const tranche::schema::amount_by_account_t& amounts) {
  auto total = tranche::schema::amount_t{};
  for (const auto& [account, amount] : amounts) {
    total += amount;
  }
  return total;
}

/// The vault holds at least everything it could be asked to pay out.
inline void expect_solvent(const tranche::execution::engine& engine) {
  using tranche::schema::asset_kind_t;
  const auto vault = engine.vault();
  const auto vault_account = engine.snapshot().vault_account();

  auto base_claims = tranche::schema::amount_t{
      engine.total_supply(asset_kind_t::i_token) + vault.remaining_fees +
      sum_amounts(vault.base_token_rewards)};
  auto governance_claims = sum_amounts(vault.governance_token_rewards);
  if (vault.dispute && vault.dispute->open) {
    base_claims += vault.dispute->initiation_amount;
    governance_claims +=
        vault.dispute->accept_weight + vault.dispute->decline_weight;
  }

  EXPECT_GE(engine.balance_of(asset_kind_t::base, vault_account), base_claims);
  EXPECT_GE(engine.balance_of(asset_kind_t::governance, vault_account),
            governance_claims);
  EXPECT_LE(vault.remaining_fees, vault.accrued_fees);
}

}  // namespace tranche::testing
