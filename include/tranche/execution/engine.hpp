#pragma once

#include <tranche/execution/world_state.hpp>
#include <tranche/schema/app_info.hpp>
#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/block_result.hpp>
#include <tranche/schema/commit_result.hpp>
#include <tranche/schema/dispute.hpp>
#include <tranche/schema/event_record.hpp>
#include <tranche/schema/genesis_allocation.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/resolved_dispute.hpp>
#include <tranche/schema/transaction.hpp>
#include <tranche/schema/transaction_error_code.hpp>
#include <tranche/schema/transaction_result.hpp>
#include <tranche/schema/vault_config.hpp>
#include <tranche/schema/vault_state.hpp>
#include <tranche/schema/vote_record.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tranche::execution {

inline constexpr std::string_view kCodespace{"tranche.vault"};

/// Called once per recorded event while a block executes.
using event_listener_t =
    std::function<void(const tranche::schema::event_record_t&)>;

/// Computes the state root reported by commit().
using state_hasher_t =
    std::function<tranche::schema::hash32_t(const world_state&)>;

/// Vault controller.
///
/// Owns the committed world state and the state of the block being
/// finalized. Every transaction runs against a scratch copy of the pending
/// state and is kept only when it succeeds. Queries always read committed
/// state.
class engine final {
 public:
  /// Build the genesis state; terminates on invalid configuration.
  engine(tranche::schema::vault_config_t config,
         const std::vector<tranche::schema::genesis_allocation_t>& genesis);

  /// Stateless admission checks: version, vault-account signer, amounts.
  tranche::schema::transaction_result_t check_transaction(
      const tranche::schema::transaction_t& tx) const;

  /// Execute `txs` in order at `block_time`.
  ///
  /// Starts from committed state; a second call without commit() replaces
  /// the previously finalized block. Per-tx results are returned even on
  /// failures.
  tranche::schema::block_result_t finalize_block(
      uint64_t height,
      tranche::schema::timestamp_seconds_t block_time,
      const std::vector<tranche::schema::transaction_t>& txs);

  /// As finalize_block; std::nullopt entries stand for transactions that
  /// could not be decoded and yield invalid_transaction in their slot.
  tranche::schema::block_result_t finalize_decoded_block(
      uint64_t height,
      tranche::schema::timestamp_seconds_t block_time,
      const std::vector<std::optional<tranche::schema::transaction_t>>& txs);

  /// Promote the last finalized block to committed state.
  tranche::schema::commit_result_t commit();

  tranche::schema::app_info_t info() const;

  bool locked() const;
  std::optional<tranche::schema::dispute_t> dispute() const;
  std::vector<tranche::schema::vote_record_t> votes() const;
  tranche::schema::vault_state_t vault() const;
  std::string oracle_condition() const;

  tranche::schema::amount_t owed_fees(
      const tranche::schema::account_id_t& account) const;
  tranche::schema::amount_t pending_base_reward(
      const tranche::schema::account_id_t& account) const;
  tranche::schema::amount_t pending_governance_reward(
      const tranche::schema::account_id_t& account) const;

  tranche::schema::amount_t balance_of(
      tranche::schema::asset_kind_t asset,
      const tranche::schema::account_id_t& account) const;
  tranche::schema::amount_t total_supply(
      tranche::schema::asset_kind_t asset) const;
  tranche::schema::amount_t allowance(
      tranche::schema::asset_kind_t asset,
      const tranche::schema::account_id_t& owner,
      const tranche::schema::account_id_t& spender) const;

  /// Committed events with ids in the inclusive range.
  std::vector<tranche::schema::event_record_t> events(uint64_t from_id,
                                                      uint64_t to_id) const;
  /// Id of the newest committed event, 0 when none.
  uint64_t last_event_id() const;

  std::vector<tranche::schema::resolved_dispute_t> dispute_history() const;

  /// Copy of the committed world state.
  world_state snapshot() const;

  /// Replace committed state with persisted state; drops any pending block.
  /// Returns false, changing nothing, when called from an event listener.
  bool restore(world_state state,
               uint64_t height,
               const tranche::schema::hash32_t& state_root,
               std::vector<tranche::schema::event_record_t> events);

  /// Safe to call from within the listener; applies from the next event.
  void set_event_listener(event_listener_t listener);
  void set_state_hasher(state_hasher_t hasher);

 private:
  tranche::schema::transaction_result_t execute_operation(
      world_state& state,
      const tranche::schema::transaction_t& tx,
      tranche::schema::timestamp_seconds_t now,
      std::vector<tranche::schema::transaction_event_t>& events) const;

  void record_events(uint64_t height,
                     uint32_t tx_index,
                     std::vector<tranche::schema::transaction_event_t> events,
                     tranche::schema::transaction_result_t& result);

  // Recursive so an event listener may query committed state.
  mutable std::recursive_mutex mutex_;
  bool executing_{false};
  world_state committed_;
  std::optional<world_state> pending_;
  uint64_t last_committed_height_{};
  tranche::schema::hash32_t last_committed_state_root_{};
  uint64_t pending_height_{};
  std::vector<tranche::schema::event_record_t> committed_events_;
  std::vector<tranche::schema::event_record_t> pending_events_;
  event_listener_t event_listener_;
  state_hasher_t state_hasher_;
};

}  // namespace tranche::execution
