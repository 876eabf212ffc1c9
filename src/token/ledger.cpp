#include <tranche/token/ledger.hpp>

#include <limits>

using namespace tranche::schema;

namespace tranche::token {

namespace {

bool would_overflow(const amount_t& lhs, const amount_t& rhs) {
  return lhs > std::numeric_limits<amount_t>::max() - rhs;
}

}  // namespace

ledger::ledger(asset_kind_t kind) : kind_{kind} {}

ledger::ledger(asset_kind_t kind, const account_id_t& minter)
    : kind_{kind}, minter_{minter} {}

amount_t ledger::balance_of(const account_id_t& account) const {
  auto found = balances_.find(account);
  if (found == std::end(balances_)) {
    return amount_t{};
  }
  return found->second;
}

amount_t ledger::allowance(const account_id_t& owner,
                           const account_id_t& spender) const {
  auto found = allowances_.find(allowance_key_t{owner, spender});
  if (found == std::end(allowances_)) {
    return amount_t{};
  }
  return found->second;
}

status_t ledger::transfer(const account_id_t& from,
                          const account_id_t& to,
                          const amount_t& amount) {
  if (balance_of(from) < amount) {
    return transaction_error_code::insufficient_balance;
  }
  if (from == to || amount == 0) {
    return std::nullopt;
  }
  // Supply bounds every balance, so crediting `to` cannot overflow.
  debit(from, amount);
  balances_[to] += amount;
  return std::nullopt;
}

status_t ledger::approve(const account_id_t& owner,
                         const account_id_t& spender,
                         const amount_t& amount) {
  if (amount == 0) {
    allowances_.erase(allowance_key_t{owner, spender});
  } else {
    allowances_[allowance_key_t{owner, spender}] = amount;
  }
  return std::nullopt;
}

status_t ledger::transfer_from(const account_id_t& spender,
                               const account_id_t& owner,
                               const account_id_t& to,
                               const amount_t& amount) {
  auto allowed = allowance(owner, spender);
  if (allowed < amount || balance_of(owner) < amount) {
    return transaction_error_code::insufficient_allowance_or_balance;
  }
  if (auto status = transfer(owner, to, amount)) {
    return status;
  }
  return approve(owner, spender, allowed - amount);
}

status_t ledger::mint(const account_id_t& caller,
                      const account_id_t& to,
                      const amount_t& amount) {
  if (auto status = check_minter(caller)) {
    return status;
  }
  return credit(to, amount);
}

status_t ledger::burn(const account_id_t& caller,
                      const account_id_t& from,
                      const amount_t& amount) {
  if (auto status = check_minter(caller)) {
    return status;
  }
  if (balance_of(from) < amount) {
    return transaction_error_code::insufficient_balance;
  }
  if (amount == 0) {
    return std::nullopt;
  }
  debit(from, amount);
  total_supply_ -= amount;
  return std::nullopt;
}

status_t ledger::credit_genesis(const account_id_t& account,
                                const amount_t& amount) {
  if (is_claim_token(kind_)) {
    return transaction_error_code::unauthorized;
  }
  return credit(account, amount);
}

std::optional<ledger> ledger::restore(
    asset_kind_t kind,
    std::optional<account_id_t> minter,
    std::map<account_id_t, amount_t> balances,
    std::map<allowance_key_t, amount_t> allowances) {
  if (is_claim_token(kind) != minter.has_value()) {
    return std::nullopt;
  }
  auto restored = ledger{};
  restored.kind_ = kind;
  restored.minter_ = std::move(minter);
  for (const auto& [account, amount] : balances) {
    if (would_overflow(restored.total_supply_, amount)) {
      return std::nullopt;
    }
    restored.total_supply_ += amount;
  }
  restored.balances_ = std::move(balances);
  restored.allowances_ = std::move(allowances);
  return restored;
}

status_t ledger::check_minter(const account_id_t& caller) const {
  if (!minter_.has_value() || *minter_ != caller) {
    return transaction_error_code::unauthorized;
  }
  return std::nullopt;
}

status_t ledger::credit(const account_id_t& account, const amount_t& amount) {
  if (would_overflow(total_supply_, amount)) {
    return transaction_error_code::amount_overflow;
  }
  if (amount == 0) {
    return std::nullopt;
  }
  total_supply_ += amount;
  balances_[account] += amount;
  return std::nullopt;
}

void ledger::debit(const account_id_t& account, const amount_t& amount) {
  auto found = balances_.find(account);
  if (found == std::end(balances_)) {
    return;
  }
  found->second -= amount;
  if (found->second == 0) {
    balances_.erase(found);
  }
}

}  // namespace tranche::token
