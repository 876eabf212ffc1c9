#include <spdlog/spdlog.h>
#include <tranche/execution/conversion_engine.hpp>
#include <tranche/execution/dispute_engine.hpp>
#include <tranche/execution/engine.hpp>
#include <tranche/execution/events.hpp>
#include <tranche/execution/fee_ledger.hpp>
#include <tranche/execution/operation_context.hpp>
#include <algorithm>
#include <iterator>
#include <utility>

using namespace tranche::schema;

namespace {

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{tranche::execution::kCodespace};
  return result;
}

std::string_view operation_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const convert_t&) { return std::string_view{"convert"}; },
          [](const redeem_t&) { return std::string_view{"redeem"}; },
          [](const initiate_dispute_t&) {
            return std::string_view{"initiate_dispute"};
          },
          [](const cast_vote_t&) { return std::string_view{"vote"}; },
          [](const resolve_dispute_t&) {
            return std::string_view{"resolve_dispute"};
          },
          [](const withdraw_owed_fees_t&) {
            return std::string_view{"withdraw_owed_fees"};
          },
          [](const withdraw_governance_reward_t&) {
            return std::string_view{"withdraw_governance_reward"};
          },
          [](const withdraw_base_reward_t&) {
            return std::string_view{"withdraw_base_reward"};
          },
          [](const transfer_asset_t&) {
            return std::string_view{"transfer_asset"};
          },
          [](const approve_asset_t&) {
            return std::string_view{"approve_asset"};
          }},
      payload);
}

// Marks the engine busy for the lifetime of one finalize_block call.
class execution_guard final {
 public:
  explicit execution_guard(bool& executing) : executing_{executing} {
    executing_ = true;
  }
  ~execution_guard() { executing_ = false; }
  execution_guard(const execution_guard&) = delete;
  execution_guard& operator=(const execution_guard&) = delete;

 private:
  bool& executing_;
};

amount_t lookup(const amount_by_account_t& balances,
                const account_id_t& account) {
  auto found = balances.find(account);
  return found == std::end(balances) ? amount_t{} : found->second;
}

}  // namespace

namespace tranche::execution {

engine::engine(vault_config_t config,
               const std::vector<genesis_allocation_t>& genesis)
    : committed_{make_world_state(config, genesis)} {
  spdlog::info("Vault engine ready: fee 1/{}, collateral 1/{}, voting {}s, "
               "zero-vote policy {}",
               committed_.config.fee_denominator,
               committed_.config.initiation_amount_denominator,
               committed_.config.dispute_duration,
               to_string(committed_.config.zero_vote_policy));
}

transaction_result_t engine::check_transaction(
    const transaction_t& tx) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "expected version 1");
  }
  {
    auto lock = std::scoped_lock{mutex_};
    if (tx.signer == committed_.vault_account()) {
      return make_error_result(transaction_error_code::unauthorized,
                               "the vault account cannot sign transactions");
    }
  }
  auto zero_amount = std::visit(
      overloaded{[](const convert_t& value) { return value.amount == 0; },
                 [](const redeem_t& value) { return value.amount == 0; },
                 [](const cast_vote_t& value) { return value.weight == 0; },
                 [](const auto&) { return false; }},
      tx.payload);
  if (zero_amount) {
    return make_error_result(transaction_error_code::invalid_amount,
                             std::string{operation_name(tx.payload)});
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    world_state& state,
    const transaction_t& tx,
    const timestamp_seconds_t now,
    std::vector<transaction_event_t>& events) const {
  auto context = operation_context{.caller = tx.signer, .now = now};
  auto status = std::visit(
      overloaded{
          [&](const convert_t& op) {
            return conversion_engine{state}.convert(context, op.amount);
          },
          [&](const redeem_t& op) {
            return conversion_engine{state}.redeem(context, op.amount);
          },
          [&](const initiate_dispute_t&) {
            return dispute_engine{state}.initiate(context);
          },
          [&](const cast_vote_t& op) {
            return dispute_engine{state}.vote(context, op.side, op.weight);
          },
          [&](const resolve_dispute_t&) {
            return dispute_engine{state}.resolve(context);
          },
          [&](const withdraw_owed_fees_t&) {
            return fee_ledger{state}.withdraw_owed_fees(context);
          },
          [&](const withdraw_governance_reward_t&) {
            return fee_ledger{state}.withdraw_governance_reward(context);
          },
          [&](const withdraw_base_reward_t&) {
            return fee_ledger{state}.withdraw_base_reward(context);
          },
          [&](const transfer_asset_t& op) -> tranche::token::status_t {
            if (auto failed = state.asset(op.asset).transfer(
                    context.caller, op.to, op.amount)) {
              return failed;
            }
            context.events.push_back(event_builder{kTransferEvent}
                                         .text("asset",
                                               std::string{to_string(op.asset)},
                                               true)
                                         .account("from", context.caller)
                                         .account("to", op.to)
                                         .amount("amount", op.amount)
                                         .build());
            return std::nullopt;
          },
          [&](const approve_asset_t& op) -> tranche::token::status_t {
            if (auto failed = state.asset(op.asset).approve(
                    context.caller, op.spender, op.amount)) {
              return failed;
            }
            context.events.push_back(event_builder{kApproveEvent}
                                         .text("asset",
                                               std::string{to_string(op.asset)},
                                               true)
                                         .account("owner", context.caller)
                                         .account("spender", op.spender)
                                         .amount("amount", op.amount)
                                         .build());
            return std::nullopt;
          }},
      tx.payload);

  if (status) {
    return make_error_result(*status, std::string{operation_name(tx.payload)});
  }
  auto result = transaction_result_t{};
  result.info = std::string{operation_name(tx.payload)} + " accepted";
  events = std::move(context.events);
  return result;
}

void engine::record_events(uint64_t height,
                           uint32_t tx_index,
                           std::vector<transaction_event_t> events,
                           transaction_result_t& result) {
  auto next_id = last_event_id() + pending_events_.size() + 1;
  for (auto& event : events) {
    auto record = event_record_t{.event_id = next_id++,
                                 .height = height,
                                 .tx_index = tx_index,
                                 .event = std::move(event)};
    result.events.push_back(record.event);
    pending_events_.push_back(std::move(record));
    // The listener may replace itself through set_event_listener.
    auto listener = event_listener_;
    if (listener) {
      listener(pending_events_.back());
    }
  }
}

block_result_t engine::finalize_block(
    uint64_t height,
    timestamp_seconds_t block_time,
    const std::vector<transaction_t>& txs) {
  auto admitted = std::vector<std::optional<transaction_t>>{};
  admitted.reserve(txs.size());
  std::copy(std::begin(txs), std::end(txs), std::back_inserter(admitted));
  return finalize_decoded_block(height, block_time, admitted);
}

block_result_t engine::finalize_decoded_block(
    uint64_t height,
    timestamp_seconds_t block_time,
    const std::vector<std::optional<transaction_t>>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.height = height;
  result.block_time = block_time;
  result.tx_results.reserve(txs.size());

  if (executing_) {
    spdlog::warn("Rejecting re-entrant finalize_block at height {}", height);
    for (size_t i = 0; i < txs.size(); ++i) {
      result.tx_results.push_back(
          make_error_result(transaction_error_code::reentrant_call));
    }
    return result;
  }
  if (height <= last_committed_height_) {
    spdlog::warn("Finalizing height {} at or below committed height {}",
                 height, last_committed_height_);
  }

  auto guard = execution_guard{executing_};
  pending_ = committed_;
  pending_height_ = height;
  pending_events_.clear();

  for (size_t i = 0; i < txs.size(); ++i) {
    if (!txs[i]) {
      result.tx_results.push_back(
          make_error_result(transaction_error_code::invalid_transaction));
      continue;
    }
    const auto& tx = *txs[i];
    auto tx_result = check_transaction(tx);
    if (tx_result.code != 0) {
      result.tx_results.push_back(std::move(tx_result));
      continue;
    }

    auto scratch = *pending_;
    auto events = std::vector<transaction_event_t>{};
    tx_result = execute_operation(scratch, tx, block_time, events);
    if (tx_result.code == 0) {
      pending_ = std::move(scratch);
      record_events(height, static_cast<uint32_t>(i), std::move(events),
                    tx_result);
    } else {
      spdlog::debug("tx {} at height {} failed: {} ({})", i, height,
                    tx_result.log, tx_result.info);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (executing_) {
    spdlog::error("Rejecting re-entrant commit during block execution");
    return commit_result_t{.committed_height = last_committed_height_,
                           .state_root = last_committed_state_root_};
  }
  if (pending_) {
    committed_ = std::move(*pending_);
    pending_.reset();
    last_committed_height_ = pending_height_;
    pending_height_ = 0;
    std::move(std::begin(pending_events_), std::end(pending_events_),
              std::back_inserter(committed_events_));
    pending_events_.clear();
    if (state_hasher_) {
      last_committed_state_root_ = state_hasher_(committed_);
    }
    spdlog::info("Committed height {}", last_committed_height_);
  }

  return commit_result_t{.committed_height = last_committed_height_,
                         .state_root = last_committed_state_root_};
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

bool engine::locked() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.vault.locked;
}

std::optional<dispute_t> engine::dispute() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.vault.dispute;
}

std::vector<vote_record_t> engine::votes() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.vault.votes;
}

vault_state_t engine::vault() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.vault;
}

std::string engine::oracle_condition() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.config.oracle_condition;
}

amount_t engine::owed_fees(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return execution::owed_fees(committed_, account).share;
}

amount_t engine::pending_base_reward(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(committed_.vault.base_token_rewards, account);
}

amount_t engine::pending_governance_reward(
    const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(committed_.vault.governance_token_rewards, account);
}

amount_t engine::balance_of(asset_kind_t asset,
                            const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.asset(asset).balance_of(account);
}

amount_t engine::total_supply(asset_kind_t asset) const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.asset(asset).total_supply();
}

amount_t engine::allowance(asset_kind_t asset,
                           const account_id_t& owner,
                           const account_id_t& spender) const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.asset(asset).allowance(owner, spender);
}

std::vector<event_record_t> engine::events(uint64_t from_id,
                                           uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<event_record_t>{};
  std::copy_if(std::begin(committed_events_), std::end(committed_events_),
               std::back_inserter(result), [&](const event_record_t& record) {
                 return record.event_id >= from_id && record.event_id <= to_id;
               });
  return result;
}

uint64_t engine::last_event_id() const {
  auto lock = std::scoped_lock{mutex_};
  if (committed_events_.empty()) {
    return 0;
  }
  return committed_events_.back().event_id;
}

std::vector<resolved_dispute_t> engine::dispute_history() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.vault.resolved_disputes;
}

world_state engine::snapshot() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_;
}

bool engine::restore(world_state state,
                     uint64_t height,
                     const hash32_t& state_root,
                     std::vector<event_record_t> events) {
  auto lock = std::scoped_lock{mutex_};
  if (executing_) {
    spdlog::error("Rejecting re-entrant restore during block execution");
    return false;
  }
  committed_ = std::move(state);
  last_committed_height_ = height;
  last_committed_state_root_ = state_root;
  committed_events_ = std::move(events);
  pending_.reset();
  pending_height_ = 0;
  pending_events_.clear();
  spdlog::info("Restored vault state at height {} with {} event(s)", height,
               committed_events_.size());
  return true;
}

void engine::set_event_listener(event_listener_t listener) {
  auto lock = std::scoped_lock{mutex_};
  event_listener_ = std::move(listener);
}

void engine::set_state_hasher(state_hasher_t hasher) {
  auto lock = std::scoped_lock{mutex_};
  state_hasher_ = std::move(hasher);
}

}  // namespace tranche::execution
