#pragma once

#include <tranche/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

namespace tranche::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  uint64_t height{};
  timestamp_seconds_t block_time{};
  std::vector<transaction_result_t> tx_results;
};

using block_result_t = block_result<1>;

}  // namespace tranche::schema
