#pragma once

#include <tranche/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace tranche::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_amount = 3,
  reentrant_call = 4,
  amount_overflow = 5,
  insufficient_balance = 10,
  insufficient_allowance_or_balance = 11,
  unauthorized = 12,
  dispute_already_open = 20,
  dispute_not_open = 21,
  voting_closed = 22,
  voting_still_active = 23,
  no_votes_cast = 24,
  no_reward_owed = 30,
  no_fees_owed = 31,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "invalid transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported transaction version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "amount must be positive", transaction_error_code::invalid_amount},
    std::pair<std::string_view, transaction_error_code>{
        "re-entrant call rejected", transaction_error_code::reentrant_call},
    std::pair<std::string_view, transaction_error_code>{
        "amount overflow", transaction_error_code::amount_overflow},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient balance", transaction_error_code::insufficient_balance},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient allowance or balance",
        transaction_error_code::insufficient_allowance_or_balance},
    std::pair<std::string_view, transaction_error_code>{
        "unauthorized", transaction_error_code::unauthorized},
    std::pair<std::string_view, transaction_error_code>{
        "dispute already open", transaction_error_code::dispute_already_open},
    std::pair<std::string_view, transaction_error_code>{
        "dispute not open", transaction_error_code::dispute_not_open},
    std::pair<std::string_view, transaction_error_code>{
        "voting closed", transaction_error_code::voting_closed},
    std::pair<std::string_view, transaction_error_code>{
        "voting still active", transaction_error_code::voting_still_active},
    std::pair<std::string_view, transaction_error_code>{
        "no votes cast", transaction_error_code::no_votes_cast},
    std::pair<std::string_view, transaction_error_code>{
        "no reward owed", transaction_error_code::no_reward_owed},
    std::pair<std::string_view, transaction_error_code>{
        "no fees owed", transaction_error_code::no_fees_owed}};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace tranche::schema
