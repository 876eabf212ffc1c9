#include <boost/program_options.hpp>
#include <tranche/common/critical.hpp>
#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/encoding/scale/encoder.hpp>
#include <tranche/schema/encoding/scale/transaction.hpp>
#include <tranche/schema/transaction.hpp>
#include <tranche/schema/vote_side.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;

tranche::schema::account_id_t get_account(const po::variables_map& vm,
                                          const std::string& name) {
  if (!vm.contains(name)) {
    tranche::common::critical("missing required account argument --{}", name);
  }
  auto value = vm[name].as<std::string>();
  auto account = tranche::schema::try_parse_account(value);
  if (!account) {
    tranche::common::critical("--{} must be 64 hex characters or a name of "
                              "at most 32 bytes",
                              name);
  }
  return *account;
}

tranche::schema::amount_t get_amount(const po::variables_map& vm,
                                     const std::string& name) {
  auto value = vm[name].as<std::string>();
  auto amount = tranche::schema::try_parse_amount(value);
  if (!amount) {
    tranche::common::critical("--{} must be a decimal integer below 2^256",
                              name);
  }
  return *amount;
}

tranche::schema::asset_kind_t get_asset(const po::variables_map& vm) {
  auto asset = tranche::schema::try_from_string<tranche::schema::asset_kind_t>(
      vm["asset"].as<std::string>());
  if (!asset) {
    tranche::common::critical("asset must be base|governance|ctoken|itoken");
  }
  return *asset;
}

tranche::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "convert") {
    return tranche::schema::convert_t{.amount = get_amount(vm, "amount")};
  }
  if (payload == "redeem") {
    return tranche::schema::redeem_t{.amount = get_amount(vm, "amount")};
  }
  if (payload == "initiate_dispute") {
    return tranche::schema::initiate_dispute_t{};
  }
  if (payload == "vote") {
    auto side = tranche::schema::try_from_string<tranche::schema::vote_side_t>(
        vm["side"].as<std::string>());
    if (!side) {
      tranche::common::critical("side must be accept|decline");
    }
    return tranche::schema::cast_vote_t{.side = *side,
                                        .weight = get_amount(vm, "amount")};
  }
  if (payload == "resolve_dispute") {
    return tranche::schema::resolve_dispute_t{};
  }
  if (payload == "withdraw_owed_fees") {
    return tranche::schema::withdraw_owed_fees_t{};
  }
  if (payload == "withdraw_governance_reward") {
    return tranche::schema::withdraw_governance_reward_t{};
  }
  if (payload == "withdraw_base_reward") {
    return tranche::schema::withdraw_base_reward_t{};
  }
  if (payload == "transfer") {
    return tranche::schema::transfer_asset_t{
        .asset = get_asset(vm),
        .to = get_account(vm, "to"),
        .amount = get_amount(vm, "amount")};
  }
  if (payload == "approve") {
    return tranche::schema::approve_asset_t{
        .asset = get_asset(vm),
        .spender = get_account(vm, "spender"),
        .amount = get_amount(vm, "amount")};
  }
  tranche::common::critical("unsupported payload '{}'", payload);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  tranche_transaction_builder transaction --payload <kind> "
               "--signer <account> [options]\n"
            << "  tranche_transaction_builder account-id --name <name>\n\n"
            << "Payloads: convert, redeem, initiate_dispute, vote, "
               "resolve_dispute, withdraw_owed_fees,\n"
            << "  withdraw_governance_reward, withdraw_base_reward, transfer, "
               "approve\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"tranche_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "transaction|account-id")(
      "payload", po::value<std::string>(), "transaction payload kind")(
      "signer", po::value<std::string>(), "signer account (hex or name)")(
      "amount", po::value<std::string>()->default_value("0"),
      "decimal amount or vote weight")(
      "side", po::value<std::string>()->default_value("accept"),
      "accept|decline")("asset",
                        po::value<std::string>()->default_value("base"),
                        "base|governance|ctoken|itoken")(
      "to", po::value<std::string>(), "transfer recipient (hex or name)")(
      "spender", po::value<std::string>(), "approved spender (hex or name)")(
      "name", po::value<std::string>(), "account name for account-id");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      tranche::common::critical("transaction mode requires --payload");
    }
    auto transaction =
        tranche::schema::transaction_t{.version = 1,
                                       .signer = get_account(vm, "signer"),
                                       .payload = build_payload(vm)};
    auto encoder = tranche::schema::encoding::scale_encoder_t{};
    auto encoded = tranche::schema::encoding::scale::encode_transaction(
        encoder, transaction);
    std::cout << tranche::schema::to_hex(
                     tranche::schema::bytes_view_t{encoded.data(),
                                                   encoded.size()})
              << '\n';
    return 0;
  }

  if (command == "account-id") {
    std::cout << tranche::schema::to_hex(get_account(vm, "name")) << '\n';
    return 0;
  }

  tranche::common::critical("command must be transaction|account-id");
}
