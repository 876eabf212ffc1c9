#pragma once
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/schema/primitives.hpp>
#include <tranche/schema/transaction.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace tranche::schema::encoding::scale {

/// (version, signer, payload kind, asset or vote side, counterparty, amount)
///
/// Payload kind is the transaction_payload_t alternative index. Fields a kind
/// does not use must be zero.
using transaction_wire_t = std::tuple<uint16_t,
                                      tranche::schema::hash32_t,
                                      uint8_t,
                                      uint8_t,
                                      tranche::schema::hash32_t,
                                      tranche::schema::hash32_t>;

transaction_wire_t to_wire(const tranche::schema::transaction_t& tx);

/// std::nullopt with `error` set when the fields do not form a transaction.
std::optional<tranche::schema::transaction_t> from_wire(
    const transaction_wire_t& wire,
    std::string& error);

tranche::schema::bytes_t encode_transaction(
    scale_encoder_t& encoder,
    const tranche::schema::transaction_t& tx);

std::optional<tranche::schema::transaction_t> decode_transaction(
    scale_encoder_t& encoder,
    const tranche::schema::bytes_view_t& raw_tx,
    std::string& error);

}  // namespace tranche::schema::encoding::scale
