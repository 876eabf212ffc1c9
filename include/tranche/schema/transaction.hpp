#pragma once
#include <tranche/schema/approve_asset.hpp>
#include <tranche/schema/cast_vote.hpp>
#include <tranche/schema/convert.hpp>
#include <tranche/schema/initiate_dispute.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/redeem.hpp>
#include <tranche/schema/resolve_dispute.hpp>
#include <tranche/schema/transfer_asset.hpp>
#include <tranche/schema/withdraw_base_reward.hpp>
#include <tranche/schema/withdraw_governance_reward.hpp>
#include <tranche/schema/withdraw_owed_fees.hpp>
#include <variant>

namespace tranche::schema {

// Alternative order is the wire discriminant; append only.
using transaction_payload_t = std::variant<convert_t,
                                           redeem_t,
                                           initiate_dispute_t,
                                           cast_vote_t,
                                           resolve_dispute_t,
                                           withdraw_owed_fees_t,
                                           withdraw_governance_reward_t,
                                           withdraw_base_reward_t,
                                           transfer_asset_t,
                                           approve_asset_t>;

template <uint16_t Version>
struct transaction;

/// `signer` is the authenticated caller supplied by the execution context.
template <>
struct transaction<1> final {
  uint16_t version{1};
  account_id_t signer{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace tranche::schema
