#include <gtest/gtest.h>
#include <tranche/node/application.hpp>
#include <tranche/node/state_codec.hpp>
#include <tranche/schema/encoding/scale/transaction.hpp>
#include <tranche/testing/execution_fixture.hpp>

#include <string>
#include <vector>

using tranche::schema::asset_kind_t;
using tranche::schema::transaction_error_code;
using tranche::testing::code_of;
using tranche::testing::make_account;
using tranche::testing::make_amount;
using tranche::testing::make_transaction;

namespace {

using encoder_t = tranche::schema::encoding::scale_encoder_t;

tranche::schema::bytes_t encode(const std::string_view signer,
                                const tranche::schema::transaction_payload_t&
                                    payload) {
  auto encoder = encoder_t{};
  return tranche::schema::encoding::scale::encode_transaction(
      encoder, make_transaction(make_account(signer), payload));
}

tranche::schema::bytes_t approve_base(const std::string_view owner,
                                      const uint64_t amount) {
  return encode(owner, tranche::schema::approve_asset_t{
                           .asset = asset_kind_t::base,
                           .spender = tranche::testing::standard_config()
                                          .vault_account,
                           .amount = make_amount(amount)});
}

}  // namespace

TEST(application, commits_survive_restart) {
  auto db = tranche::testing::make_db_path("tranche_application_restart");
  auto root = tranche::schema::hash32_t{};
  {
    auto app = tranche::node::application{
        db, tranche::testing::standard_config(),
        tranche::testing::standard_genesis()};
    EXPECT_EQ(app.info().last_block_height, 0u);

    auto block = app.finalize_block(
        1, tranche::testing::kGenesisTime,
        std::vector<tranche::schema::bytes_t>{
            approve_base("alice", 4040),
            encode("alice",
                   tranche::schema::convert_t{.amount = make_amount(4040)})});
    ASSERT_EQ(block.tx_results.size(), 2u);
    EXPECT_EQ(block.tx_results[0].code, 0u);
    EXPECT_EQ(block.tx_results[1].code, 0u);

    auto committed = app.commit();
    EXPECT_EQ(committed.committed_height, 1u);
    auto encoder = encoder_t{};
    EXPECT_EQ(committed.state_root,
              tranche::node::compute_state_root(encoder,
                                                app.engine().snapshot()));
    EXPECT_NE(committed.state_root, tranche::schema::make_zero_hash());
    root = committed.state_root;
  }
  {
    // Genesis is ignored once a committed state exists.
    auto app = tranche::node::application{
        db, tranche::testing::standard_config(), {}};
    EXPECT_EQ(app.info().last_block_height, 1u);
    EXPECT_EQ(app.info().last_block_state_root, root);
    const auto& engine = app.engine();
    EXPECT_EQ(engine.balance_of(asset_kind_t::c_token, make_account("alice")),
              make_amount(4000));
    EXPECT_EQ(engine.vault().accrued_fees, make_amount(40));
    EXPECT_EQ(engine.last_event_id(), 2u);
    auto events = engine.events(1, 2);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event.type, "approve");
    EXPECT_EQ(events[1].event.type, "convert");

    auto block = app.finalize_block(
        2, tranche::testing::kGenesisTime + 10,
        std::vector<tranche::schema::bytes_t>{
            approve_base("bob", 1000),
            encode("bob", tranche::schema::initiate_dispute_t{})});
    EXPECT_EQ(block.tx_results[1].code, 0u);
    auto committed = app.commit();
    EXPECT_EQ(committed.committed_height, 2u);
    EXPECT_NE(committed.state_root, root);
    EXPECT_EQ(app.engine().last_event_id(), 4u);
  }
  {
    auto app = tranche::node::application{
        db, tranche::testing::standard_config(), {}};
    EXPECT_EQ(app.info().last_block_height, 2u);
    EXPECT_TRUE(app.engine().dispute().has_value());
    EXPECT_EQ(app.engine().dispute()->initiation_amount, make_amount(1000));
    auto events = app.engine().events(1, 100);
    ASSERT_EQ(events.size(), 4u);
    for (size_t i = 0; i < events.size(); ++i) {
      EXPECT_EQ(events[i].event_id, i + 1);
    }
    EXPECT_EQ(events[3].event.type, "initiate_dispute");
    EXPECT_EQ(events[3].height, 2u);
  }
  tranche::testing::remove_path(db);
}

TEST(application, malformed_transactions_fail_in_place) {
  auto db = tranche::testing::make_db_path("tranche_application_malformed");
  {
    auto app = tranche::node::application{
        db, tranche::testing::standard_config(),
        tranche::testing::standard_genesis()};
    auto garbage = tranche::schema::bytes_t{0x01, 0x00, 0x02};

    auto checked = app.check_transaction(
        tranche::schema::bytes_view_t{garbage.data(), garbage.size()});
    EXPECT_EQ(checked.code,
              code_of(transaction_error_code::invalid_transaction));
    EXPECT_EQ(checked.info, "malformed SCALE transaction");
    EXPECT_EQ(checked.codespace, "tranche.vault");

    auto valid = approve_base("alice", 10);
    auto admitted = app.check_transaction(
        tranche::schema::bytes_view_t{valid.data(), valid.size()});
    EXPECT_EQ(admitted.code, 0u);

    auto block = app.finalize_block(
        1, tranche::testing::kGenesisTime,
        std::vector<tranche::schema::bytes_t>{garbage, {}, valid});
    ASSERT_EQ(block.tx_results.size(), 3u);
    EXPECT_EQ(block.tx_results[0].code,
              code_of(transaction_error_code::invalid_transaction));
    EXPECT_EQ(block.tx_results[0].info, "malformed SCALE transaction");
    EXPECT_EQ(block.tx_results[1].info, "empty transaction");
    EXPECT_EQ(block.tx_results[2].code, 0u);
    app.commit();
    EXPECT_EQ(app.engine().allowance(
                  asset_kind_t::base, make_account("alice"),
                  tranche::testing::standard_config().vault_account),
              make_amount(10));
  }
  tranche::testing::remove_path(db);
}

TEST(application, zero_amount_is_refused_at_admission) {
  auto db = tranche::testing::make_db_path("tranche_application_zero");
  {
    auto app = tranche::node::application{
        db, tranche::testing::standard_config(),
        tranche::testing::standard_genesis()};
    auto zero = encode(
        "alice", tranche::schema::redeem_t{.amount = make_amount(0)});
    auto checked = app.check_transaction(
        tranche::schema::bytes_view_t{zero.data(), zero.size()});
    EXPECT_EQ(checked.code, code_of(transaction_error_code::invalid_amount));
  }
  tranche::testing::remove_path(db);
}
