#pragma once
#include <tranche/schema/primitives.hpp>
#include <string_view>

namespace tranche::blake3 {

tranche::schema::hash32_t hash(const std::string_view& str);
tranche::schema::hash32_t hash(const tranche::schema::bytes_view_t& bytes);

}  // namespace tranche::blake3
