#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: asset kind.
// Vault workflow: Tags which of the four ledgers a balance operation targets;
// only the two claim kinds carry the mint/burn capability.
namespace tranche::schema {

enum class asset_kind_t : uint8_t {
  base = 0,
  governance = 1,
  c_token = 2,
  i_token = 3
};

inline constexpr auto kAssetKindMappings = std::array{
    std::pair<std::string_view, asset_kind_t>{"base", asset_kind_t::base},
    std::pair<std::string_view, asset_kind_t>{"governance",
                                              asset_kind_t::governance},
    std::pair<std::string_view, asset_kind_t>{"ctoken", asset_kind_t::c_token},
    std::pair<std::string_view, asset_kind_t>{"itoken", asset_kind_t::i_token}};

template <>
inline std::optional<asset_kind_t> try_from_string<asset_kind_t>(
    const std::string_view value) {
  return from_string(value, kAssetKindMappings);
}

inline constexpr std::string_view to_string(const asset_kind_t value) {
  return to_string(value, kAssetKindMappings).value_or("unknown");
}

inline constexpr bool is_claim_token(const asset_kind_t value) {
  return value == asset_kind_t::c_token || value == asset_kind_t::i_token;
}

}  // namespace tranche::schema
