#include <tranche/blake3/hash.hpp>
#include <tranche/node/state_codec.hpp>
#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/dispute_outcome.hpp>
#include <tranche/schema/vote_side.hpp>
#include <tranche/schema/zero_vote_policy.hpp>
#include <string>
#include <tuple>
#include <vector>

using namespace tranche::schema;
using tranche::schema::encoding::scale_encoder_t;

namespace tranche::node {

namespace {

inline constexpr auto kWorldStateVersion = uint16_t{1};
inline constexpr auto kEventRecordVersion = uint16_t{1};

using amount_row_t = std::tuple<hash32_t, hash32_t>;
using allowance_row_t = std::tuple<hash32_t, hash32_t, hash32_t>;
using ledger_wire_t =
    std::tuple<std::vector<amount_row_t>, std::vector<allowance_row_t>>;

// vault_account, oracle_condition, fee_denominator,
// initiation_amount_denominator, dispute_duration, zero_vote_policy
using config_wire_t =
    std::tuple<hash32_t, std::string, uint64_t, uint64_t, uint64_t, uint8_t>;

// id, initiator, initiation_amount, end_time, accept, decline, open
using dispute_wire_t = std::tuple<uint64_t,
                                  hash32_t,
                                  hash32_t,
                                  uint64_t,
                                  hash32_t,
                                  hash32_t,
                                  bool>;

using vote_wire_t = std::tuple<hash32_t, uint8_t, hash32_t>;

// id, initiator, initiation_amount, end_time, accept, decline, vote_count,
// outcome, resolved_at
using resolved_wire_t = std::tuple<uint64_t,
                                   hash32_t,
                                   hash32_t,
                                   uint64_t,
                                   hash32_t,
                                   hash32_t,
                                   uint64_t,
                                   uint8_t,
                                   uint64_t>;

using vault_wire_t = std::tuple<bool,
                                hash32_t,
                                hash32_t,
                                std::vector<amount_row_t>,
                                std::vector<amount_row_t>,
                                std::vector<amount_row_t>,
                                std::optional<dispute_wire_t>,
                                std::vector<vote_wire_t>,
                                uint64_t,
                                std::vector<resolved_wire_t>>;

using world_state_wire_t = std::tuple<uint16_t,
                                      config_wire_t,
                                      vault_wire_t,
                                      ledger_wire_t,
                                      ledger_wire_t,
                                      ledger_wire_t,
                                      ledger_wire_t>;

using attribute_wire_t = std::tuple<std::string, std::string, bool>;

// version, event_id, height, tx_index, type, attributes
using event_record_wire_t = std::tuple<uint16_t,
                                       uint64_t,
                                       uint64_t,
                                       uint32_t,
                                       std::string,
                                       std::vector<attribute_wire_t>>;

std::vector<amount_row_t> to_rows(const amount_by_account_t& amounts) {
  auto rows = std::vector<amount_row_t>{};
  rows.reserve(amounts.size());
  for (const auto& [account, amount] : amounts) {
    rows.emplace_back(account, to_le_bytes(amount));
  }
  return rows;
}

amount_by_account_t from_rows(const std::vector<amount_row_t>& rows) {
  auto amounts = amount_by_account_t{};
  for (const auto& [account, amount] : rows) {
    amounts[account] = from_le_bytes(amount);
  }
  return amounts;
}

ledger_wire_t to_wire(const tranche::token::ledger& ledger) {
  auto allowances = std::vector<allowance_row_t>{};
  allowances.reserve(ledger.allowances().size());
  for (const auto& [key, amount] : ledger.allowances()) {
    allowances.emplace_back(key.first, key.second, to_le_bytes(amount));
  }
  return ledger_wire_t{to_rows(ledger.balances()), std::move(allowances)};
}

std::optional<tranche::token::ledger> from_wire(
    const ledger_wire_t& wire,
    asset_kind_t kind,
    const account_id_t& vault_account) {
  auto allowances = std::map<tranche::token::allowance_key_t, amount_t>{};
  for (const auto& [owner, spender, amount] : std::get<1>(wire)) {
    allowances[tranche::token::allowance_key_t{owner, spender}] =
        from_le_bytes(amount);
  }
  auto minter = is_claim_token(kind) ? std::optional<account_id_t>{vault_account}
                                     : std::nullopt;
  return tranche::token::ledger::restore(kind, minter,
                                         from_rows(std::get<0>(wire)),
                                         std::move(allowances));
}

vault_wire_t to_wire(const vault_state_t& vault) {
  auto dispute = std::optional<dispute_wire_t>{};
  if (vault.dispute) {
    const auto& value = *vault.dispute;
    dispute = dispute_wire_t{value.dispute_id,
                             value.initiator,
                             to_le_bytes(value.initiation_amount),
                             value.end_time,
                             to_le_bytes(value.accept_weight),
                             to_le_bytes(value.decline_weight),
                             value.open};
  }

  auto votes = std::vector<vote_wire_t>{};
  votes.reserve(vault.votes.size());
  for (const auto& vote : vault.votes) {
    votes.emplace_back(vote.voter, static_cast<uint8_t>(vote.side),
                       to_le_bytes(vote.weight));
  }

  auto resolved = std::vector<resolved_wire_t>{};
  resolved.reserve(vault.resolved_disputes.size());
  for (const auto& entry : vault.resolved_disputes) {
    resolved.emplace_back(entry.dispute_id, entry.initiator,
                          to_le_bytes(entry.initiation_amount), entry.end_time,
                          to_le_bytes(entry.accept_weight),
                          to_le_bytes(entry.decline_weight), entry.vote_count,
                          static_cast<uint8_t>(entry.outcome),
                          entry.resolved_at);
  }

  return vault_wire_t{vault.locked,
                      to_le_bytes(vault.accrued_fees),
                      to_le_bytes(vault.remaining_fees),
                      to_rows(vault.accrued_fees_at_last_withdrawal),
                      to_rows(vault.base_token_rewards),
                      to_rows(vault.governance_token_rewards),
                      std::move(dispute),
                      std::move(votes),
                      vault.dispute_count,
                      std::move(resolved)};
}

std::optional<vault_state_t> from_wire(const vault_wire_t& wire) {
  auto vault = vault_state_t{};
  vault.locked = std::get<0>(wire);
  vault.accrued_fees = from_le_bytes(std::get<1>(wire));
  vault.remaining_fees = from_le_bytes(std::get<2>(wire));
  if (vault.remaining_fees > vault.accrued_fees) {
    return std::nullopt;
  }
  vault.accrued_fees_at_last_withdrawal = from_rows(std::get<3>(wire));
  vault.base_token_rewards = from_rows(std::get<4>(wire));
  vault.governance_token_rewards = from_rows(std::get<5>(wire));

  if (const auto& dispute = std::get<6>(wire)) {
    const auto& [id, initiator, amount, end_time, accept, decline, open] =
        *dispute;
    vault.dispute = dispute_t{.dispute_id = id,
                              .initiator = initiator,
                              .initiation_amount = from_le_bytes(amount),
                              .end_time = end_time,
                              .accept_weight = from_le_bytes(accept),
                              .decline_weight = from_le_bytes(decline),
                              .open = open};
  }

  for (const auto& [voter, side_byte, weight] : std::get<7>(wire)) {
    auto side = from_underlying(side_byte, kVoteSideMappings);
    if (!side) {
      return std::nullopt;
    }
    vault.votes.push_back(vote_record_t{
        .voter = voter, .side = *side, .weight = from_le_bytes(weight)});
  }
  vault.dispute_count = std::get<8>(wire);

  for (const auto& row : std::get<9>(wire)) {
    auto outcome = from_underlying(std::get<7>(row), kDisputeOutcomeMappings);
    if (!outcome) {
      return std::nullopt;
    }
    vault.resolved_disputes.push_back(resolved_dispute_t{
        .dispute_id = std::get<0>(row),
        .initiator = std::get<1>(row),
        .initiation_amount = from_le_bytes(std::get<2>(row)),
        .end_time = std::get<3>(row),
        .accept_weight = from_le_bytes(std::get<4>(row)),
        .decline_weight = from_le_bytes(std::get<5>(row)),
        .vote_count = std::get<6>(row),
        .outcome = *outcome,
        .resolved_at = std::get<8>(row)});
  }
  return vault;
}

}  // namespace

bytes_t encode_world_state(scale_encoder_t& encoder,
                           const tranche::execution::world_state& state) {
  const auto& config = state.config;
  auto wire = world_state_wire_t{
      kWorldStateVersion,
      config_wire_t{config.vault_account, config.oracle_condition,
                    config.fee_denominator,
                    config.initiation_amount_denominator,
                    config.dispute_duration,
                    static_cast<uint8_t>(config.zero_vote_policy)},
      to_wire(state.vault),
      to_wire(state.base_asset),
      to_wire(state.governance_asset),
      to_wire(state.c_token),
      to_wire(state.i_token)};
  return encoder.encode(wire);
}

std::optional<tranche::execution::world_state> decode_world_state(
    scale_encoder_t& encoder,
    const bytes_view_t& bytes) {
  auto wire = encoder.try_decode<world_state_wire_t>(bytes);
  if (!wire || std::get<0>(*wire) != kWorldStateVersion) {
    return std::nullopt;
  }

  auto state = tranche::execution::world_state{};
  const auto& [vault_account, oracle_condition, fee_denominator,
               initiation_amount_denominator, dispute_duration, policy] =
      std::get<1>(*wire);
  auto zero_vote_policy = from_underlying(policy, kZeroVotePolicyMappings);
  if (!zero_vote_policy) {
    return std::nullopt;
  }
  state.config = vault_config_t{
      .vault_account = vault_account,
      .oracle_condition = oracle_condition,
      .fee_denominator = fee_denominator,
      .initiation_amount_denominator = initiation_amount_denominator,
      .dispute_duration = dispute_duration,
      .zero_vote_policy = *zero_vote_policy};
  if (tranche::execution::validate_config(state.config)) {
    return std::nullopt;
  }

  auto vault = from_wire(std::get<2>(*wire));
  auto base = from_wire(std::get<3>(*wire), asset_kind_t::base, vault_account);
  auto governance =
      from_wire(std::get<4>(*wire), asset_kind_t::governance, vault_account);
  auto c_token =
      from_wire(std::get<5>(*wire), asset_kind_t::c_token, vault_account);
  auto i_token =
      from_wire(std::get<6>(*wire), asset_kind_t::i_token, vault_account);
  if (!vault || !base || !governance || !c_token || !i_token) {
    return std::nullopt;
  }
  state.vault = std::move(*vault);
  state.base_asset = std::move(*base);
  state.governance_asset = std::move(*governance);
  state.c_token = std::move(*c_token);
  state.i_token = std::move(*i_token);
  return state;
}

bytes_t encode_event_record(scale_encoder_t& encoder,
                            const event_record_t& record) {
  auto attributes = std::vector<attribute_wire_t>{};
  attributes.reserve(record.event.attributes.size());
  for (const auto& attribute : record.event.attributes) {
    attributes.emplace_back(attribute.key, attribute.value, attribute.index);
  }
  return encoder.encode(event_record_wire_t{
      kEventRecordVersion, record.event_id, record.height, record.tx_index,
      record.event.type, std::move(attributes)});
}

std::optional<event_record_t> decode_event_record(scale_encoder_t& encoder,
                                                  const bytes_view_t& bytes) {
  auto wire = encoder.try_decode<event_record_wire_t>(bytes);
  if (!wire || std::get<0>(*wire) != kEventRecordVersion) {
    return std::nullopt;
  }
  auto record = event_record_t{};
  record.event_id = std::get<1>(*wire);
  record.height = std::get<2>(*wire);
  record.tx_index = std::get<3>(*wire);
  record.event.type = std::get<4>(*wire);
  for (const auto& [key, value, index] : std::get<5>(*wire)) {
    record.event.attributes.push_back(transaction_event_attribute_t{
        .key = key, .value = value, .index = index});
  }
  return record;
}

hash32_t compute_state_root(scale_encoder_t& encoder,
                            const tranche::execution::world_state& state) {
  auto encoded = encode_world_state(encoder, state);
  return tranche::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace tranche::node
