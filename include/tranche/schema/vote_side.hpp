#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tranche::schema {

enum class vote_side_t : uint8_t { accept = 0, decline = 1 };

inline constexpr auto kVoteSideMappings = std::array{
    std::pair<std::string_view, vote_side_t>{"accept", vote_side_t::accept},
    std::pair<std::string_view, vote_side_t>{"decline", vote_side_t::decline}};

template <>
inline std::optional<vote_side_t> try_from_string<vote_side_t>(
    const std::string_view value) {
  return from_string(value, kVoteSideMappings);
}

inline constexpr std::string_view to_string(const vote_side_t value) {
  return to_string(value, kVoteSideMappings).value_or("unknown");
}

}  // namespace tranche::schema
