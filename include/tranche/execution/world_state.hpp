#pragma once

#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/genesis_allocation.hpp>
#include <tranche/schema/vault_config.hpp>
#include <tranche/schema/vault_state.hpp>
#include <tranche/token/ledger.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tranche::execution {

/// Complete state of one vault execution context.
///
/// The base and governance ledgers stand for assets the vault does not
/// control; the claim token ledgers are created here with the vault account
/// as their only minter. Copyable, so a transaction can run on a scratch copy
/// and be discarded on failure.
struct world_state final {
  tranche::schema::vault_config_t config;
  tranche::schema::vault_state_t vault;
  tranche::token::ledger base_asset{tranche::schema::asset_kind_t::base};
  tranche::token::ledger governance_asset{
      tranche::schema::asset_kind_t::governance};
  tranche::token::ledger c_token;
  tranche::token::ledger i_token;

  tranche::token::ledger& asset(tranche::schema::asset_kind_t kind);
  const tranche::token::ledger& asset(
      tranche::schema::asset_kind_t kind) const;

  const tranche::schema::account_id_t& vault_account() const {
    return config.vault_account;
  }
};

/// Build the genesis state. Terminates on invalid configuration or on an
/// allocation targeting a claim token.
world_state make_world_state(
    const tranche::schema::vault_config_t& config,
    const std::vector<tranche::schema::genesis_allocation_t>& genesis);

/// Returns a reason when `config` cannot drive a vault (zero denominators).
std::optional<std::string> validate_config(
    const tranche::schema::vault_config_t& config);

}  // namespace tranche::execution
