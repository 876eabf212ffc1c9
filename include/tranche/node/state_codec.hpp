#pragma once
#include <tranche/execution/world_state.hpp>
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/schema/event_record.hpp>
#include <tranche/schema/primitives.hpp>
#include <optional>

namespace tranche::node {

/// SCALE encoding of the complete world state.
///
/// Amounts travel as 32-byte little-endian words and enums as their
/// underlying byte, so the encoding is canonical and its BLAKE3 hash is the
/// state root.
tranche::schema::bytes_t encode_world_state(
    tranche::schema::encoding::scale_encoder_t& encoder,
    const tranche::execution::world_state& state);

/// std::nullopt when the bytes are malformed or violate ledger invariants.
std::optional<tranche::execution::world_state> decode_world_state(
    tranche::schema::encoding::scale_encoder_t& encoder,
    const tranche::schema::bytes_view_t& bytes);

tranche::schema::bytes_t encode_event_record(
    tranche::schema::encoding::scale_encoder_t& encoder,
    const tranche::schema::event_record_t& record);

std::optional<tranche::schema::event_record_t> decode_event_record(
    tranche::schema::encoding::scale_encoder_t& encoder,
    const tranche::schema::bytes_view_t& bytes);

/// BLAKE3 of encode_world_state(state).
tranche::schema::hash32_t compute_state_root(
    tranche::schema::encoding::scale_encoder_t& encoder,
    const tranche::execution::world_state& state);

}  // namespace tranche::node
