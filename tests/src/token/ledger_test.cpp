#include <gtest/gtest.h>
#include <tranche/testing/common.hpp>
#include <tranche/token/ledger.hpp>

#include <limits>
#include <map>

namespace {

using tranche::schema::asset_kind_t;
using tranche::schema::transaction_error_code;
using tranche::testing::make_account;
using tranche::testing::make_amount;

tranche::token::ledger funded_base_ledger() {
  auto ledger = tranche::token::ledger{asset_kind_t::base};
  EXPECT_FALSE(ledger.credit_genesis(make_account("alice"), make_amount(100)));
  EXPECT_FALSE(ledger.credit_genesis(make_account("bob"), make_amount(50)));
  return ledger;
}

}  // namespace

TEST(token_ledger, genesis_credits_supply_and_balances) {
  auto ledger = funded_base_ledger();
  EXPECT_EQ(ledger.total_supply(), make_amount(150));
  EXPECT_EQ(ledger.balance_of(make_account("alice")), make_amount(100));
  EXPECT_EQ(ledger.balance_of(make_account("carol")), make_amount(0));
  EXPECT_FALSE(ledger.minter().has_value());
}

TEST(token_ledger, transfer_moves_balance_and_keeps_supply) {
  auto ledger = funded_base_ledger();
  auto status = ledger.transfer(make_account("alice"), make_account("carol"),
                                make_amount(40));
  EXPECT_FALSE(status.has_value());
  EXPECT_EQ(ledger.balance_of(make_account("alice")), make_amount(60));
  EXPECT_EQ(ledger.balance_of(make_account("carol")), make_amount(40));
  EXPECT_EQ(ledger.total_supply(), make_amount(150));
}

TEST(token_ledger, transfer_shortfall_changes_nothing) {
  auto ledger = funded_base_ledger();
  auto status = ledger.transfer(make_account("bob"), make_account("alice"),
                                make_amount(51));
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, transaction_error_code::insufficient_balance);
  EXPECT_EQ(ledger.balance_of(make_account("bob")), make_amount(50));
  EXPECT_EQ(ledger.balance_of(make_account("alice")), make_amount(100));
}

TEST(token_ledger, self_transfer_and_zero_transfer_are_no_ops) {
  auto ledger = funded_base_ledger();
  EXPECT_FALSE(ledger.transfer(make_account("alice"), make_account("alice"),
                               make_amount(100)));
  EXPECT_FALSE(ledger.transfer(make_account("carol"), make_account("alice"),
                               make_amount(0)));
  EXPECT_EQ(ledger.balance_of(make_account("alice")), make_amount(100));
  EXPECT_EQ(ledger.balances().count(make_account("carol")), 0u);
}

TEST(token_ledger, emptied_balances_are_erased) {
  auto ledger = funded_base_ledger();
  EXPECT_FALSE(ledger.transfer(make_account("bob"), make_account("alice"),
                               make_amount(50)));
  EXPECT_EQ(ledger.balances().count(make_account("bob")), 0u);
}

TEST(token_ledger, approve_overwrites_and_zero_revokes) {
  auto ledger = funded_base_ledger();
  EXPECT_FALSE(ledger.approve(make_account("alice"), make_account("vault"),
                              make_amount(30)));
  EXPECT_FALSE(ledger.approve(make_account("alice"), make_account("vault"),
                              make_amount(20)));
  EXPECT_EQ(ledger.allowance(make_account("alice"), make_account("vault")),
            make_amount(20));
  EXPECT_FALSE(ledger.approve(make_account("alice"), make_account("vault"),
                              make_amount(0)));
  EXPECT_TRUE(ledger.allowances().empty());
}

TEST(token_ledger, transfer_from_spends_allowance) {
  auto ledger = funded_base_ledger();
  ASSERT_FALSE(ledger.approve(make_account("alice"), make_account("vault"),
                              make_amount(30)));
  auto status =
      ledger.transfer_from(make_account("vault"), make_account("alice"),
                           make_account("vault"), make_amount(25));
  EXPECT_FALSE(status.has_value());
  EXPECT_EQ(ledger.balance_of(make_account("vault")), make_amount(25));
  EXPECT_EQ(ledger.allowance(make_account("alice"), make_account("vault")),
            make_amount(5));
}

TEST(token_ledger, transfer_from_requires_allowance_and_balance) {
  auto ledger = funded_base_ledger();
  auto no_allowance =
      ledger.transfer_from(make_account("vault"), make_account("alice"),
                           make_account("vault"), make_amount(1));
  ASSERT_TRUE(no_allowance.has_value());
  EXPECT_EQ(*no_allowance,
            transaction_error_code::insufficient_allowance_or_balance);

  ASSERT_FALSE(ledger.approve(make_account("bob"), make_account("vault"),
                              make_amount(500)));
  auto no_balance =
      ledger.transfer_from(make_account("vault"), make_account("bob"),
                           make_account("vault"), make_amount(60));
  ASSERT_TRUE(no_balance.has_value());
  EXPECT_EQ(*no_balance,
            transaction_error_code::insufficient_allowance_or_balance);
  EXPECT_EQ(ledger.allowance(make_account("bob"), make_account("vault")),
            make_amount(500));
  EXPECT_EQ(ledger.balance_of(make_account("bob")), make_amount(50));
}

TEST(token_ledger, only_the_minter_changes_claim_token_supply) {
  auto vault = make_account("vault");
  auto ledger = tranche::token::ledger{asset_kind_t::c_token, vault};

  auto rejected = ledger.mint(make_account("alice"), make_account("alice"),
                              make_amount(10));
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(*rejected, transaction_error_code::unauthorized);

  EXPECT_FALSE(ledger.mint(vault, make_account("alice"), make_amount(10)));
  EXPECT_EQ(ledger.total_supply(), make_amount(10));

  auto burn_rejected =
      ledger.burn(make_account("alice"), make_account("alice"), make_amount(1));
  ASSERT_TRUE(burn_rejected.has_value());
  EXPECT_EQ(*burn_rejected, transaction_error_code::unauthorized);

  EXPECT_FALSE(ledger.burn(vault, make_account("alice"), make_amount(4)));
  EXPECT_EQ(ledger.total_supply(), make_amount(6));
  EXPECT_EQ(ledger.balance_of(make_account("alice")), make_amount(6));
}

TEST(token_ledger, burn_beyond_balance_is_refused) {
  auto vault = make_account("vault");
  auto ledger = tranche::token::ledger{asset_kind_t::i_token, vault};
  ASSERT_FALSE(ledger.mint(vault, make_account("alice"), make_amount(3)));
  auto status = ledger.burn(vault, make_account("alice"), make_amount(4));
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, transaction_error_code::insufficient_balance);
  EXPECT_EQ(ledger.total_supply(), make_amount(3));
  EXPECT_FALSE(ledger.burn(vault, make_account("nobody"), make_amount(0)));
}

TEST(token_ledger, base_ledger_never_mints) {
  auto ledger = tranche::token::ledger{asset_kind_t::base};
  auto status = ledger.mint(make_account("vault"), make_account("alice"),
                            make_amount(1));
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, transaction_error_code::unauthorized);
}

TEST(token_ledger, claim_tokens_reject_genesis_credits) {
  auto ledger =
      tranche::token::ledger{asset_kind_t::i_token, make_account("vault")};
  auto status = ledger.credit_genesis(make_account("alice"), make_amount(1));
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, transaction_error_code::unauthorized);
}

TEST(token_ledger, supply_overflow_is_reported) {
  auto ledger = tranche::token::ledger{asset_kind_t::base};
  auto max = std::numeric_limits<tranche::schema::amount_t>::max();
  ASSERT_FALSE(ledger.credit_genesis(make_account("alice"), max));
  auto status = ledger.credit_genesis(make_account("bob"), make_amount(1));
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, transaction_error_code::amount_overflow);
}

TEST(token_ledger, restore_recomputes_supply_and_checks_minter) {
  auto balances = std::map<tranche::schema::account_id_t,
                           tranche::schema::amount_t>{
      {make_account("alice"), make_amount(7)},
      {make_account("bob"), make_amount(5)}};
  auto restored = tranche::token::ledger::restore(
      asset_kind_t::c_token, make_account("vault"), balances, {});
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->total_supply(), make_amount(12));
  EXPECT_EQ(restored->minter(), make_account("vault"));

  EXPECT_FALSE(tranche::token::ledger::restore(asset_kind_t::c_token,
                                               std::nullopt, balances, {})
                   .has_value());
  EXPECT_FALSE(tranche::token::ledger::restore(asset_kind_t::base,
                                               make_account("vault"),
                                               balances, {})
                   .has_value());
}
