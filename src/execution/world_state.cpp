#include <spdlog/spdlog.h>
#include <tranche/common/critical.hpp>
#include <tranche/execution/world_state.hpp>

using namespace tranche::schema;

namespace tranche::execution {

tranche::token::ledger& world_state::asset(asset_kind_t kind) {
  switch (kind) {
    case asset_kind_t::base:
      return base_asset;
    case asset_kind_t::governance:
      return governance_asset;
    case asset_kind_t::c_token:
      return c_token;
    case asset_kind_t::i_token:
      return i_token;
  }
  tranche::common::critical("unknown asset kind");
}

const tranche::token::ledger& world_state::asset(asset_kind_t kind) const {
  return const_cast<world_state&>(*this).asset(kind);
}

std::optional<std::string> validate_config(const vault_config_t& config) {
  if (config.fee_denominator == 0) {
    return "fee_denominator must be non-zero";
  }
  if (config.initiation_amount_denominator == 0) {
    return "initiation_amount_denominator must be non-zero";
  }
  if (config.vault_account == make_zero_hash()) {
    return "vault_account must be set";
  }
  return std::nullopt;
}

world_state make_world_state(const vault_config_t& config,
                             const std::vector<genesis_allocation_t>& genesis) {
  if (auto reason = validate_config(config)) {
    tranche::common::critical("invalid vault config: {}", *reason);
  }

  auto state = world_state{};
  state.config = config;
  state.c_token =
      tranche::token::ledger{asset_kind_t::c_token, config.vault_account};
  state.i_token =
      tranche::token::ledger{asset_kind_t::i_token, config.vault_account};

  for (const auto& allocation : genesis) {
    auto status = state.asset(allocation.asset)
                      .credit_genesis(allocation.account, allocation.amount);
    if (status) {
      tranche::common::critical("genesis allocation of {} to {} rejected: {}",
                                to_string(allocation.asset),
                                to_hex(allocation.account),
                                to_string(*status));
    }
  }
  spdlog::info("Vault genesis: {} allocation(s), oracle condition '{}'",
               genesis.size(), config.oracle_condition);
  return state;
}

}  // namespace tranche::execution
