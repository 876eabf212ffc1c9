#include <spdlog/spdlog.h>
#include <tranche/common/critical.hpp>
#include <tranche/node/application.hpp>
#include <tranche/node/state_codec.hpp>
#include <tranche/schema/encoding/scale/transaction.hpp>
#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

using namespace tranche::schema;

namespace {

bytes_t make_event_key(tranche::schema::encoding::scale_encoder_t& encoder,
                       const uint64_t event_id) {
  auto key = make_bytes(tranche::node::kEventPrefix);
  encoder.encode(event_id, key);
  return key;
}

}  // namespace

namespace tranche::node {

application::application(const std::string_view& db_path,
                         const vault_config_t& config,
                         const std::vector<genesis_allocation_t>& genesis)
    : storage_{tranche::storage::make_storage<
          tranche::storage::rocksdb_storage_tag>(db_path)},
      engine_{config, genesis} {
  engine_.set_state_hasher([this](const tranche::execution::world_state& state) {
    return compute_state_root(encoder_, state);
  });
  load_persisted_state();
}

transaction_result_t application::check_transaction(
    const bytes_view_t& raw_tx) {
  auto error = std::string{};
  auto tx = encoding::scale::decode_transaction(encoder_, raw_tx, error);
  if (!tx) {
    auto result = transaction_result_t{};
    result.code = static_cast<uint32_t>(
        transaction_error_code::invalid_transaction);
    result.log = std::string{
        to_string(transaction_error_code::invalid_transaction)};
    result.info = std::move(error);
    result.codespace = std::string{tranche::execution::kCodespace};
    return result;
  }
  return engine_.check_transaction(*tx);
}

block_result_t application::finalize_block(
    uint64_t height,
    timestamp_seconds_t block_time,
    const std::vector<bytes_t>& txs) {
  auto decoded = std::vector<std::optional<transaction_t>>{};
  auto errors = std::vector<std::string>(txs.size());
  decoded.reserve(txs.size());
  for (size_t i = 0; i < txs.size(); ++i) {
    decoded.push_back(encoding::scale::decode_transaction(
        encoder_, bytes_view_t{txs[i].data(), txs[i].size()}, errors[i]));
  }

  auto result = engine_.finalize_decoded_block(height, block_time, decoded);
  for (size_t i = 0; i < result.tx_results.size() && i < errors.size(); ++i) {
    if (!decoded[i] && result.tx_results[i].info.empty()) {
      result.tx_results[i].info = errors[i];
    }
  }
  return result;
}

commit_result_t application::commit() {
  auto result = engine_.commit();

  auto entries = std::vector<tranche::storage::key_value_entry_t>{};
  entries.emplace_back(make_bytes(kWorldStateKey),
                       encode_world_state(encoder_, engine_.snapshot()));
  auto last_event_id = engine_.last_event_id();
  for (const auto& record :
       engine_.events(persisted_event_id_ + 1, last_event_id)) {
    entries.emplace_back(make_event_key(encoder_, record.event_id),
                         encode_event_record(encoder_, record));
  }

  storage_.commit(
      tranche::storage::committed_state{.height = result.committed_height,
                                        .state_root = result.state_root},
      entries);
  spdlog::debug("Persisted height {} with {} new event(s)",
                result.committed_height, last_event_id - persisted_event_id_);
  persisted_event_id_ = last_event_id;
  return result;
}

app_info_t application::info() const {
  return engine_.info();
}

void application::load_persisted_state() {
  auto committed = storage_.load_committed_state();
  if (!committed) {
    spdlog::info("No committed state found; starting from genesis");
    return;
  }

  auto blob = storage_.get_raw(make_bytes_view(kWorldStateKey));
  if (!blob) {
    tranche::common::critical("committed height {} has no world state",
                              committed->height);
  }
  auto state = decode_world_state(encoder_,
                                  bytes_view_t{blob->data(), blob->size()});
  if (!state) {
    tranche::common::critical("failed to decode persisted world state");
  }
  if (compute_state_root(encoder_, *state) != committed->state_root) {
    tranche::common::critical("persisted world state does not match root {}",
                              to_hex(committed->state_root));
  }

  auto events = std::vector<event_record_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(kEventPrefix))) {
    auto record =
        decode_event_record(encoder_, bytes_view_t{value.data(), value.size()});
    if (!record) {
      tranche::common::critical("failed to decode persisted event record");
    }
    events.push_back(std::move(*record));
  }
  // Keys carry little-endian ids, so iteration order is not id order.
  std::sort(std::begin(events), std::end(events),
            [](const event_record_t& lhs, const event_record_t& rhs) {
              return lhs.event_id < rhs.event_id;
            });
  persisted_event_id_ = events.empty() ? 0 : events.back().event_id;

  if (!engine_.restore(std::move(*state), committed->height,
                       committed->state_root, std::move(events))) {
    tranche::common::critical("failed to restore persisted vault state");
  }
}

}  // namespace tranche::node
