#include <tranche/schema/encoding/scale/transaction.hpp>

#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/vote_side.hpp>
#include <variant>

using namespace tranche::schema;

namespace tranche::schema::encoding::scale {

namespace {

struct wire_fields final {
  uint8_t aux{};
  hash32_t counterparty{};
  amount_t amount{};
};

wire_fields fields_of(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const convert_t& op) { return wire_fields{.amount = op.amount}; },
          [](const redeem_t& op) { return wire_fields{.amount = op.amount}; },
          [](const cast_vote_t& op) {
            return wire_fields{.aux = static_cast<uint8_t>(op.side),
                               .amount = op.weight};
          },
          [](const transfer_asset_t& op) {
            return wire_fields{.aux = static_cast<uint8_t>(op.asset),
                               .counterparty = op.to,
                               .amount = op.amount};
          },
          [](const approve_asset_t& op) {
            return wire_fields{.aux = static_cast<uint8_t>(op.asset),
                               .counterparty = op.spender,
                               .amount = op.amount};
          },
          [](const auto&) { return wire_fields{}; }},
      payload);
}

}  // namespace

transaction_wire_t to_wire(const transaction_t& tx) {
  auto fields = fields_of(tx.payload);
  return transaction_wire_t{tx.version,
                            tx.signer,
                            static_cast<uint8_t>(tx.payload.index()),
                            fields.aux,
                            fields.counterparty,
                            to_le_bytes(fields.amount)};
}

std::optional<transaction_t> from_wire(const transaction_wire_t& wire,
                                       std::string& error) {
  const auto& [version, signer, kind, aux, counterparty, amount_bytes] = wire;
  auto tx = transaction_t{};
  tx.version = version;
  tx.signer = signer;
  auto amount = from_le_bytes(amount_bytes);
  auto uses_counterparty = false;
  auto uses_aux = false;
  auto uses_amount = true;

  switch (kind) {
    case 0:
      tx.payload = convert_t{.amount = amount};
      break;
    case 1:
      tx.payload = redeem_t{.amount = amount};
      break;
    case 2:
      tx.payload = initiate_dispute_t{};
      uses_amount = false;
      break;
    case 3: {
      auto side = from_underlying(aux, kVoteSideMappings);
      if (!side) {
        error = "unknown vote side";
        return std::nullopt;
      }
      tx.payload = cast_vote_t{.side = *side, .weight = amount};
      uses_aux = true;
      break;
    }
    case 4:
      tx.payload = resolve_dispute_t{};
      uses_amount = false;
      break;
    case 5:
      tx.payload = withdraw_owed_fees_t{};
      uses_amount = false;
      break;
    case 6:
      tx.payload = withdraw_governance_reward_t{};
      uses_amount = false;
      break;
    case 7:
      tx.payload = withdraw_base_reward_t{};
      uses_amount = false;
      break;
    case 8:
    case 9: {
      auto asset = from_underlying(aux, kAssetKindMappings);
      if (!asset) {
        error = "unknown asset kind";
        return std::nullopt;
      }
      if (kind == 8) {
        tx.payload = transfer_asset_t{
            .asset = *asset, .to = counterparty, .amount = amount};
      } else {
        tx.payload = approve_asset_t{
            .asset = *asset, .spender = counterparty, .amount = amount};
      }
      uses_aux = true;
      uses_counterparty = true;
      break;
    }
    default:
      error = "unknown payload kind " + std::to_string(kind);
      return std::nullopt;
  }

  if ((!uses_aux && aux != 0) ||
      (!uses_counterparty && counterparty != make_zero_hash()) ||
      (!uses_amount && amount != 0)) {
    error = "non-zero field unused by payload kind " + std::to_string(kind);
    return std::nullopt;
  }
  return tx;
}

bytes_t encode_transaction(scale_encoder_t& encoder, const transaction_t& tx) {
  return encoder.encode(to_wire(tx));
}

std::optional<transaction_t> decode_transaction(scale_encoder_t& encoder,
                                                const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto wire = encoder.try_decode<transaction_wire_t>(raw_tx);
  if (!wire) {
    error = "malformed SCALE transaction";
    return std::nullopt;
  }
  return from_wire(*wire, error);
}

}  // namespace tranche::schema::encoding::scale
