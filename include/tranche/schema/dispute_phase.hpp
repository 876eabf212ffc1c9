#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace tranche::schema {

enum class dispute_phase_t : uint8_t { closed = 0, open = 1 };

inline constexpr auto kDisputePhaseMappings = std::array{
    std::pair<std::string_view, dispute_phase_t>{"closed",
                                                 dispute_phase_t::closed},
    std::pair<std::string_view, dispute_phase_t>{"open",
                                                 dispute_phase_t::open}};

inline constexpr std::string_view to_string(const dispute_phase_t value) {
  return to_string(value, kDisputePhaseMappings).value_or("unknown");
}

}  // namespace tranche::schema
