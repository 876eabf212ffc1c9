#pragma once
#include <tranche/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tranche::storage {

using key_value_entry_t =
    std::pair<tranche::schema::bytes_t, tranche::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t height{};
  tranche::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Raw value at key, or std::nullopt when missing.
  std::optional<tranche::schema::bytes_t> get_raw(
      const tranche::schema::bytes_view_t& key) const;

  /// Atomically write `entries` together with the committed checkpoint.
  void commit(const committed_state& state,
              const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const tranche::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tranche::storage
