#pragma once

#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/transaction_error_code.hpp>
#include <map>
#include <optional>
#include <utility>

namespace tranche::token {

/// std::nullopt on success, otherwise the reason the operation was refused.
using status_t = std::optional<tranche::schema::transaction_error_code>;

using allowance_key_t = std::pair<tranche::schema::account_id_t,
                                  tranche::schema::account_id_t>;

/// Fungible balance ledger backing all four vault assets.
///
/// Base and governance ledgers are plain transferable balances. Claim token
/// ledgers (cToken, iToken) additionally accept `mint`/`burn`, but only from
/// the `minter` account fixed at construction. A failed operation leaves the
/// ledger untouched.
class ledger final {
 public:
  ledger() = default;

  /// External asset ledger without a mint capability.
  explicit ledger(tranche::schema::asset_kind_t kind);

  /// Claim token ledger whose supply only `minter` may change.
  ledger(tranche::schema::asset_kind_t kind,
         const tranche::schema::account_id_t& minter);

  tranche::schema::asset_kind_t kind() const { return kind_; }
  const std::optional<tranche::schema::account_id_t>& minter() const {
    return minter_;
  }

  const tranche::schema::amount_t& total_supply() const {
    return total_supply_;
  }

  tranche::schema::amount_t balance_of(
      const tranche::schema::account_id_t& account) const;

  tranche::schema::amount_t allowance(
      const tranche::schema::account_id_t& owner,
      const tranche::schema::account_id_t& spender) const;

  /// Move `amount` from `from` to `to`; insufficient_balance on shortfall.
  status_t transfer(const tranche::schema::account_id_t& from,
                    const tranche::schema::account_id_t& to,
                    const tranche::schema::amount_t& amount);

  /// Replace the allowance `owner` grants `spender`.
  status_t approve(const tranche::schema::account_id_t& owner,
                   const tranche::schema::account_id_t& spender,
                   const tranche::schema::amount_t& amount);

  /// Spend `owner`'s allowance for `spender`, moving `amount` to `to`.
  ///
  /// Fails with insufficient_allowance_or_balance if either the allowance or
  /// the owner's balance is short.
  status_t transfer_from(const tranche::schema::account_id_t& spender,
                         const tranche::schema::account_id_t& owner,
                         const tranche::schema::account_id_t& to,
                         const tranche::schema::amount_t& amount);

  status_t mint(const tranche::schema::account_id_t& caller,
                const tranche::schema::account_id_t& to,
                const tranche::schema::amount_t& amount);

  /// insufficient_balance if `from` holds less than `amount`.
  status_t burn(const tranche::schema::account_id_t& caller,
                const tranche::schema::account_id_t& from,
                const tranche::schema::amount_t& amount);

  /// Seed an external asset balance before the first block.
  status_t credit_genesis(const tranche::schema::account_id_t& account,
                          const tranche::schema::amount_t& amount);

  const std::map<tranche::schema::account_id_t, tranche::schema::amount_t>&
  balances() const {
    return balances_;
  }

  const std::map<allowance_key_t, tranche::schema::amount_t>& allowances()
      const {
    return allowances_;
  }

  /// Rebuild a ledger from persisted rows; total supply is recomputed.
  static std::optional<ledger> restore(
      tranche::schema::asset_kind_t kind,
      std::optional<tranche::schema::account_id_t> minter,
      std::map<tranche::schema::account_id_t, tranche::schema::amount_t>
          balances,
      std::map<allowance_key_t, tranche::schema::amount_t> allowances);

 private:
  status_t check_minter(const tranche::schema::account_id_t& caller) const;
  status_t credit(const tranche::schema::account_id_t& account,
                  const tranche::schema::amount_t& amount);
  void debit(const tranche::schema::account_id_t& account,
             const tranche::schema::amount_t& amount);

  tranche::schema::asset_kind_t kind_{tranche::schema::asset_kind_t::base};
  std::optional<tranche::schema::account_id_t> minter_;
  tranche::schema::amount_t total_supply_{};
  std::map<tranche::schema::account_id_t, tranche::schema::amount_t>
      balances_;
  std::map<allowance_key_t, tranche::schema::amount_t> allowances_;
};

}  // namespace tranche::token
