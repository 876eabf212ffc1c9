#include <gtest/gtest.h>
#include <tranche/testing/execution_fixture.hpp>

using tranche::schema::asset_kind_t;
using tranche::schema::dispute_outcome_t;
using tranche::schema::transaction_error_code;
using tranche::schema::vote_side_t;
using tranche::testing::code_of;
using tranche::testing::expect_solvent;
using tranche::testing::kGenesisBase;
using tranche::testing::kGenesisGovernance;
using tranche::testing::make_account;
using tranche::testing::make_amount;

namespace {

constexpr auto kVotingPeriod = tranche::schema::kDefaultDisputeDuration;

// alice converts 4040 so the iToken supply is 4000, then bob opens a dispute
// with collateral 1000.
void open_dispute(tranche::testing::execution_fixture& fixture) {
  ASSERT_EQ(fixture.convert("alice", 4040).code, 0u);
  ASSERT_EQ(fixture.engine().total_supply(asset_kind_t::i_token),
            make_amount(4000));
  ASSERT_EQ(fixture.approve_vault("bob", asset_kind_t::base, 1000).code, 0u);
  auto opened =
      fixture.submit("bob", tranche::schema::initiate_dispute_t{});
  ASSERT_EQ(opened.code, 0u) << opened.log;
}

tranche::schema::transaction_result_t resolve(
    tranche::testing::execution_fixture& fixture) {
  return fixture.submit("alice", tranche::schema::resolve_dispute_t{});
}

}  // namespace

TEST(dispute, initiate_posts_quarter_of_itoken_supply) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);

  auto dispute = fixture.engine().dispute();
  ASSERT_TRUE(dispute.has_value());
  EXPECT_TRUE(dispute->open);
  EXPECT_EQ(dispute->dispute_id, 1u);
  EXPECT_EQ(dispute->initiator, make_account("bob"));
  EXPECT_EQ(dispute->initiation_amount, make_amount(1000));
  EXPECT_EQ(dispute->end_time, fixture.now() + kVotingPeriod);
  EXPECT_EQ(fixture.balance(asset_kind_t::base, "bob"),
            make_amount(kGenesisBase - 1000));
  EXPECT_TRUE(fixture.engine().locked());
  expect_solvent(fixture.engine());
}

TEST(dispute, only_one_dispute_at_a_time) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);
  ASSERT_EQ(fixture.approve_vault("carol", asset_kind_t::base, 1000).code, 0u);
  auto second = fixture.submit("carol", tranche::schema::initiate_dispute_t{});
  EXPECT_EQ(second.code, code_of(transaction_error_code::dispute_already_open));
  EXPECT_EQ(fixture.engine().dispute()->initiator, make_account("bob"));
  EXPECT_EQ(fixture.balance(asset_kind_t::base, "carol"),
            make_amount(kGenesisBase));
}

TEST(dispute, initiate_without_collateral_allowance_leaves_slot_empty) {
  auto fixture = tranche::testing::execution_fixture{};
  ASSERT_EQ(fixture.convert("alice", 4040).code, 0u);
  auto result = fixture.submit("bob", tranche::schema::initiate_dispute_t{});
  EXPECT_EQ(result.code,
            code_of(transaction_error_code::insufficient_allowance_or_balance));
  EXPECT_FALSE(fixture.engine().dispute().has_value());
  EXPECT_EQ(fixture.engine().vault().dispute_count, 0u);
}

TEST(dispute, empty_vault_opens_with_zero_collateral) {
  auto fixture = tranche::testing::execution_fixture{};
  auto result = fixture.submit("bob", tranche::schema::initiate_dispute_t{});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(fixture.engine().dispute()->initiation_amount, make_amount(0));
}

TEST(dispute, vote_and_resolve_need_an_open_dispute) {
  auto fixture = tranche::testing::execution_fixture{};
  EXPECT_EQ(fixture.vote("carol", vote_side_t::accept, 10).code,
            code_of(transaction_error_code::dispute_not_open));
  EXPECT_EQ(resolve(fixture).code,
            code_of(transaction_error_code::dispute_not_open));
  EXPECT_EQ(fixture.balance(asset_kind_t::governance, "carol"),
            make_amount(kGenesisGovernance));
}

TEST(dispute, voting_window_is_inclusive_of_end_time) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);

  fixture.advance(kVotingPeriod);
  EXPECT_EQ(resolve(fixture).code,
            code_of(transaction_error_code::voting_still_active));
  EXPECT_EQ(fixture.vote("carol", vote_side_t::accept, 100).code, 0u);

  fixture.advance(1);
  EXPECT_EQ(fixture.vote("dave", vote_side_t::decline, 100).code,
            code_of(transaction_error_code::voting_closed));
  EXPECT_EQ(fixture.balance(asset_kind_t::governance, "dave"),
            make_amount(kGenesisGovernance));
  EXPECT_EQ(resolve(fixture).code, 0u);
}

TEST(dispute, declined_dispute_rewards_decliners) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);
  ASSERT_EQ(fixture.vote("carol", vote_side_t::accept, 100).code, 0u);
  ASSERT_EQ(fixture.vote("dave", vote_side_t::decline, 100).code, 0u);
  ASSERT_EQ(fixture.vote("erin", vote_side_t::decline, 300).code, 0u);

  auto dispute = fixture.engine().dispute();
  EXPECT_EQ(dispute->accept_weight, make_amount(100));
  EXPECT_EQ(dispute->decline_weight, make_amount(400));
  EXPECT_EQ(fixture.engine().votes().size(), 3u);
  expect_solvent(fixture.engine());

  fixture.advance(kVotingPeriod + 1);
  auto result = resolve(fixture);
  ASSERT_EQ(result.code, 0u) << result.log;
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "resolve_dispute");
  EXPECT_EQ(result.events[0].attribute("outcome"), "declined");
  EXPECT_EQ(result.events[0].attribute("locked"), "true");

  auto& engine = fixture.engine();
  EXPECT_TRUE(engine.locked());
  EXPECT_FALSE(engine.dispute()->open);
  EXPECT_EQ(engine.pending_governance_reward(make_account("erin")),
            make_amount(375));
  EXPECT_EQ(engine.pending_base_reward(make_account("erin")),
            make_amount(750));
  EXPECT_EQ(engine.pending_governance_reward(make_account("dave")),
            make_amount(125));
  EXPECT_EQ(engine.pending_base_reward(make_account("dave")),
            make_amount(250));
  EXPECT_EQ(engine.pending_governance_reward(make_account("carol")),
            make_amount(0));
  EXPECT_EQ(engine.pending_base_reward(make_account("bob")), make_amount(0));
  expect_solvent(engine);

  ASSERT_EQ(fixture.submit("erin", tranche::schema::withdraw_base_reward_t{})
                .code,
            0u);
  ASSERT_EQ(
      fixture.submit("erin", tranche::schema::withdraw_governance_reward_t{})
          .code,
      0u);
  EXPECT_EQ(fixture.balance(asset_kind_t::base, "erin"),
            make_amount(kGenesisBase + 750));
  EXPECT_EQ(fixture.balance(asset_kind_t::governance, "erin"),
            make_amount(kGenesisGovernance + 75));
  expect_solvent(engine);

  auto history = engine.dispute_history();
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].outcome, dispute_outcome_t::declined);
  EXPECT_EQ(history[0].vote_count, 3u);
  EXPECT_EQ(history[0].resolved_at, fixture.now());
}

TEST(dispute, accepted_dispute_unlocks_the_vault) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);
  ASSERT_EQ(fixture.vote("carol", vote_side_t::accept, 300).code, 0u);
  ASSERT_EQ(fixture.vote("dave", vote_side_t::decline, 100).code, 0u);
  fixture.advance(kVotingPeriod + 1);

  auto result = resolve(fixture);
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(result.events[0].attribute("outcome"), "accepted");
  EXPECT_EQ(result.events[0].attribute("locked"), "false");

  auto& engine = fixture.engine();
  EXPECT_FALSE(engine.locked());
  EXPECT_EQ(fixture.balance(asset_kind_t::base, "bob"),
            make_amount(kGenesisBase));
  EXPECT_EQ(engine.pending_governance_reward(make_account("carol")),
            make_amount(400));
  EXPECT_EQ(engine.pending_governance_reward(make_account("dave")),
            make_amount(0));
  EXPECT_TRUE(engine.vault().base_token_rewards.empty());
  expect_solvent(engine);

  // Unlocked redemption burns iToken only.
  auto redeemed = fixture.submit(
      "alice", tranche::schema::redeem_t{.amount = make_amount(1000)});
  ASSERT_EQ(redeemed.code, 0u) << redeemed.log;
  EXPECT_EQ(redeemed.events[0].attribute("locked"), "false");
  EXPECT_EQ(fixture.balance(asset_kind_t::i_token, "alice"), make_amount(3000));
  EXPECT_EQ(fixture.balance(asset_kind_t::c_token, "alice"), make_amount(4000));
  expect_solvent(engine);
}

TEST(dispute, tied_vote_is_declined) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);
  ASSERT_EQ(fixture.vote("carol", vote_side_t::accept, 200).code, 0u);
  ASSERT_EQ(fixture.vote("dave", vote_side_t::decline, 200).code, 0u);
  fixture.advance(kVotingPeriod + 1);
  ASSERT_EQ(resolve(fixture).code, 0u);
  EXPECT_TRUE(fixture.engine().locked());
  EXPECT_EQ(fixture.engine().pending_governance_reward(make_account("dave")),
            make_amount(400));
  EXPECT_EQ(fixture.engine().pending_base_reward(make_account("dave")),
            make_amount(1000));
}

TEST(dispute, zero_votes_refund_the_initiator) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);
  fixture.advance(kVotingPeriod + 1);
  auto result = resolve(fixture);
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(result.events[0].attribute("outcome"), "no_votes");
  EXPECT_EQ(fixture.balance(asset_kind_t::base, "bob"),
            make_amount(kGenesisBase));
  EXPECT_TRUE(fixture.engine().locked());
  EXPECT_EQ(fixture.engine().dispute_history().at(0).outcome,
            dispute_outcome_t::no_votes);
  expect_solvent(fixture.engine());
}

TEST(dispute, zero_votes_rejected_under_reject_policy) {
  auto config = tranche::testing::standard_config();
  config.zero_vote_policy = tranche::schema::zero_vote_policy_t::reject;
  auto fixture = tranche::testing::execution_fixture{config};
  open_dispute(fixture);
  fixture.advance(kVotingPeriod + 1);
  EXPECT_EQ(resolve(fixture).code,
            code_of(transaction_error_code::no_votes_cast));
  EXPECT_TRUE(fixture.engine().dispute()->open);
  EXPECT_TRUE(fixture.engine().dispute_history().empty());
}

TEST(dispute, slot_is_reused_after_resolution) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);
  ASSERT_EQ(fixture.vote("dave", vote_side_t::decline, 50).code, 0u);
  fixture.advance(kVotingPeriod + 1);
  ASSERT_EQ(resolve(fixture).code, 0u);

  ASSERT_EQ(fixture.approve_vault("carol", asset_kind_t::base, 1000).code, 0u);
  auto reopened = fixture.submit("carol", tranche::schema::initiate_dispute_t{});
  ASSERT_EQ(reopened.code, 0u) << reopened.log;
  auto dispute = fixture.engine().dispute();
  EXPECT_EQ(dispute->dispute_id, 2u);
  EXPECT_EQ(dispute->initiator, make_account("carol"));
  EXPECT_EQ(dispute->accept_weight, make_amount(0));
  EXPECT_TRUE(fixture.engine().votes().empty());
  EXPECT_EQ(fixture.engine().dispute_history().size(), 1u);
  expect_solvent(fixture.engine());
}

TEST(dispute, repeated_votes_accumulate) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);
  ASSERT_EQ(fixture.vote("erin", vote_side_t::decline, 100).code, 0u);
  ASSERT_EQ(fixture.vote("erin", vote_side_t::decline, 200).code, 0u);
  EXPECT_EQ(fixture.engine().dispute()->decline_weight, make_amount(300));
  EXPECT_EQ(fixture.engine().votes().size(), 2u);
  EXPECT_EQ(fixture.vote("erin", vote_side_t::accept, kGenesisGovernance).code,
            code_of(transaction_error_code::insufficient_allowance_or_balance));
}

TEST(dispute, rounded_rewards_never_exceed_stakes_and_collateral) {
  auto fixture = tranche::testing::execution_fixture{};
  open_dispute(fixture);
  ASSERT_EQ(fixture.vote("alice", vote_side_t::accept, 2).code, 0u);
  ASSERT_EQ(fixture.vote("carol", vote_side_t::decline, 1).code, 0u);
  ASSERT_EQ(fixture.vote("dave", vote_side_t::decline, 1).code, 0u);
  ASSERT_EQ(fixture.vote("erin", vote_side_t::decline, 1).code, 0u);
  fixture.advance(kVotingPeriod + 1);
  ASSERT_EQ(resolve(fixture).code, 0u);

  auto vault = fixture.engine().vault();
  EXPECT_EQ(vault.governance_token_rewards.at(make_account("carol")),
            make_amount(1));
  EXPECT_EQ(vault.base_token_rewards.at(make_account("carol")),
            make_amount(333));
  EXPECT_LE(tranche::testing::sum_amounts(vault.governance_token_rewards),
            make_amount(5));
  EXPECT_LE(tranche::testing::sum_amounts(vault.base_token_rewards),
            make_amount(1000));
  expect_solvent(fixture.engine());
}
