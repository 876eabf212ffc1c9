#pragma once

#include <tranche/schema/primitives.hpp>
#include <cstdint>

namespace tranche::schema {

template <uint16_t Version>
struct commit_result;

/// `state_root` is filled in by the persistence layer; the in-memory engine
/// leaves it zero.
template <>
struct commit_result<1> final {
  uint16_t version{1};
  uint64_t committed_height{};
  hash32_t state_root{};
};

using commit_result_t = commit_result<1>;

}  // namespace tranche::schema
