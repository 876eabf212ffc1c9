#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tranche::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
// Intermediate width for pro-rata products of two amounts.
using wide_amount_t = boost::multiprecision::uint512_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Readable account id: the UTF-8 name, zero padded (truncated past 32 bytes).
account_id_t make_account_id(const std::string_view& name);

/// 64 hex characters, otherwise a name of at most 32 bytes.
std::optional<account_id_t> try_parse_account(const std::string_view& value);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view& hex);

/// Fixed 32-byte little-endian representation used on the wire.
hash32_t to_le_bytes(const amount_t& amount);
amount_t from_le_bytes(const hash32_t& bytes);

std::optional<amount_t> try_parse_amount(const std::string_view& decimal);
std::string to_string(const amount_t& amount);

}  // namespace tranche::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
