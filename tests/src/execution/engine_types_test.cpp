#include <gtest/gtest.h>
#include <tranche/execution/engine.hpp>
#include <tranche/execution/world_state.hpp>
#include <tranche/testing/execution_fixture.hpp>

using tranche::schema::transaction_error_code;
using tranche::testing::code_of;
using tranche::testing::make_account;
using tranche::testing::make_amount;
using tranche::testing::make_transaction;

TEST(engine_types, defaults_are_stable) {
  auto tx = tranche::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_TRUE(tx.codespace.empty());
  EXPECT_TRUE(tx.events.empty());

  auto block = tranche::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());

  auto commit = tranche::schema::commit_result_t{};
  EXPECT_EQ(commit.committed_height, 0u);
  EXPECT_EQ(commit.state_root, tranche::schema::make_zero_hash());

  auto info = tranche::schema::app_info_t{};
  EXPECT_EQ(info.data, "tranche-vault");
  EXPECT_EQ(info.app_version, "0.1.0");

  auto config = tranche::schema::vault_config_t{};
  EXPECT_EQ(config.fee_denominator, 100u);
  EXPECT_EQ(config.initiation_amount_denominator, 4u);
  EXPECT_EQ(config.dispute_duration, 604800u);
  EXPECT_EQ(config.zero_vote_policy,
            tranche::schema::zero_vote_policy_t::refund_initiator);

  auto vault = tranche::schema::vault_state_t{};
  EXPECT_TRUE(vault.locked);
  EXPECT_EQ(tranche::schema::current_phase(vault),
            tranche::schema::dispute_phase_t::closed);
}

TEST(engine_types, config_validation) {
  auto config = tranche::testing::standard_config();
  EXPECT_FALSE(tranche::execution::validate_config(config).has_value());

  auto no_fee = config;
  no_fee.fee_denominator = 0;
  EXPECT_TRUE(tranche::execution::validate_config(no_fee).has_value());

  auto no_collateral = config;
  no_collateral.initiation_amount_denominator = 0;
  EXPECT_TRUE(tranche::execution::validate_config(no_collateral).has_value());

  auto no_vault = config;
  no_vault.vault_account = tranche::schema::make_zero_hash();
  EXPECT_TRUE(tranche::execution::validate_config(no_vault).has_value());
}

TEST(engine_types, genesis_state_is_locked_and_empty) {
  auto engine = tranche::execution::engine{
      tranche::testing::standard_config(),
      tranche::testing::standard_genesis()};
  EXPECT_TRUE(engine.locked());
  EXPECT_FALSE(engine.dispute().has_value());
  EXPECT_TRUE(engine.votes().empty());
  EXPECT_EQ(engine.oracle_condition(),
            tranche::testing::standard_config().oracle_condition);
  EXPECT_EQ(engine.total_supply(tranche::schema::asset_kind_t::base),
            make_amount(5 * tranche::testing::kGenesisBase));
  EXPECT_EQ(engine.total_supply(tranche::schema::asset_kind_t::c_token),
            make_amount(0));
  EXPECT_EQ(engine.last_event_id(), 0u);
  EXPECT_EQ(engine.info().last_block_height, 0u);
  EXPECT_EQ(engine.snapshot().c_token.minter(),
            engine.snapshot().vault_account());
}

TEST(engine_types, check_transaction_admission) {
  auto engine = tranche::execution::engine{
      tranche::testing::standard_config(),
      tranche::testing::standard_genesis()};
  auto alice = make_account("alice");

  auto ok = engine.check_transaction(make_transaction(
      alice, tranche::schema::convert_t{.amount = make_amount(5)}));
  EXPECT_EQ(ok.code, 0u);

  auto future = make_transaction(alice, tranche::schema::resolve_dispute_t{});
  future.version = 2;
  auto version = engine.check_transaction(future);
  EXPECT_EQ(version.code,
            code_of(transaction_error_code::unsupported_transaction_version));
  EXPECT_EQ(version.codespace, "tranche.vault");

  auto vault_signed = engine.check_transaction(make_transaction(
      engine.snapshot().vault_account(),
      tranche::schema::withdraw_owed_fees_t{}));
  EXPECT_EQ(vault_signed.code, code_of(transaction_error_code::unauthorized));

  auto zero_vote = engine.check_transaction(make_transaction(
      alice, tranche::schema::cast_vote_t{
                 .side = tranche::schema::vote_side_t::accept,
                 .weight = make_amount(0)}));
  EXPECT_EQ(zero_vote.code, code_of(transaction_error_code::invalid_amount));
  EXPECT_EQ(zero_vote.log, "amount must be positive");
  EXPECT_EQ(zero_vote.info, "vote");

  // Zero transfers and approvals are ordinary ledger no-ops.
  auto zero_transfer = engine.check_transaction(make_transaction(
      alice, tranche::schema::transfer_asset_t{
                 .asset = tranche::schema::asset_kind_t::base,
                 .to = make_account("bob"),
                 .amount = make_amount(0)}));
  EXPECT_EQ(zero_transfer.code, 0u);
}

TEST(engine_types, check_transaction_reads_no_block_state) {
  auto engine = tranche::execution::engine{
      tranche::testing::standard_config(),
      tranche::testing::standard_genesis()};
  // Admission passes even though execution would fail for lack of funds.
  auto result = engine.check_transaction(make_transaction(
      make_account("nobody"),
      tranche::schema::redeem_t{.amount = make_amount(1)}));
  EXPECT_EQ(result.code, 0u);
}
