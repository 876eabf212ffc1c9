#pragma once

#include <tranche/execution/engine.hpp>
#include <tranche/schema/app_info.hpp>
#include <tranche/schema/block_result.hpp>
#include <tranche/schema/commit_result.hpp>
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/schema/genesis_allocation.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/transaction_result.hpp>
#include <tranche/schema/vault_config.hpp>
#include <tranche/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tranche::node {

inline constexpr auto kWorldStateKey = std::string_view{"SYS|APP|STATE"};
inline constexpr auto kEventPrefix = std::string_view{"SYS|EVENT|"};

/// RocksDB-backed vault node.
///
/// Accepts SCALE-encoded transactions, drives the vault engine block by
/// block, and persists the committed world state, its BLAKE3 state root and
/// the event log atomically at each commit. Reopening the same path resumes
/// from the last committed block; `config` and `genesis` only seed a fresh
/// database.
class application final {
 public:
  application(const std::string_view& db_path,
              const tranche::schema::vault_config_t& config,
              const std::vector<tranche::schema::genesis_allocation_t>&
                  genesis);

  /// Decode and run the stateless admission checks.
  tranche::schema::transaction_result_t check_transaction(
      const tranche::schema::bytes_view_t& raw_tx);

  tranche::schema::block_result_t finalize_block(
      uint64_t height,
      tranche::schema::timestamp_seconds_t block_time,
      const std::vector<tranche::schema::bytes_t>& txs);

  /// Commit the finalized block in memory, then persist it.
  tranche::schema::commit_result_t commit();

  tranche::schema::app_info_t info() const;

  tranche::execution::engine& engine() { return engine_; }
  const tranche::execution::engine& engine() const { return engine_; }

 private:
  void load_persisted_state();

  tranche::schema::encoding::scale_encoder_t encoder_;
  tranche::storage::storage<tranche::storage::rocksdb_storage_tag> storage_;
  tranche::execution::engine engine_;
  uint64_t persisted_event_id_{};
};

}  // namespace tranche::node
