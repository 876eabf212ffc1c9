#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tranche/common/critical.hpp>
#include <tranche/node/application.hpp>
#include <tranche/schema/asset_kind.hpp>
#include <tranche/schema/zero_vote_policy.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

tranche::schema::account_id_t parse_account(const std::string& value,
                                            const std::string_view& option) {
  auto account = tranche::schema::try_parse_account(value);
  if (!account) {
    tranche::common::critical("--{} '{}' is not an account", option, value);
  }
  return *account;
}

// asset:account:amount
tranche::schema::genesis_allocation_t parse_genesis(const std::string& value) {
  auto first = value.find(':');
  auto last = value.rfind(':');
  if (first == std::string::npos || first == last) {
    tranche::common::critical("genesis '{}' must be asset:account:amount",
                              value);
  }
  auto asset = tranche::schema::try_from_string<tranche::schema::asset_kind_t>(
      std::string_view{value}.substr(0, first));
  auto amount = tranche::schema::try_parse_amount(
      std::string_view{value}.substr(last + 1));
  if (!asset || !amount) {
    tranche::common::critical("genesis '{}' has a bad asset or amount", value);
  }
  return tranche::schema::genesis_allocation_t{
      .asset = *asset,
      .account = parse_account(value.substr(first + 1, last - first - 1),
                               "genesis"),
      .amount = *amount};
}

void print_block(const tranche::schema::block_result_t& block) {
  std::cout << "block " << block.height << " time " << block.block_time
            << '\n';
  for (size_t i = 0; i < block.tx_results.size(); ++i) {
    const auto& result = block.tx_results[i];
    std::cout << "  tx " << i << " code " << result.code;
    if (result.code != 0) {
      std::cout << " [" << result.codespace << "] " << result.log;
    }
    if (!result.info.empty()) {
      std::cout << " (" << result.info << ")";
    }
    std::cout << '\n';
    for (const auto& event : result.events) {
      std::cout << "    " << event.type;
      for (const auto& attribute : event.attributes) {
        std::cout << ' ' << attribute.key << '=' << attribute.value;
      }
      std::cout << '\n';
    }
  }
}

void print_vault(const tranche::execution::engine& engine,
                 const std::vector<tranche::schema::account_id_t>& accounts) {
  auto vault = engine.vault();
  std::cout << "oracle condition: " << engine.oracle_condition() << '\n'
            << "locked: " << (vault.locked ? "true" : "false") << '\n'
            << "accrued fees: " << tranche::schema::to_string(vault.accrued_fees)
            << '\n'
            << "remaining fees: "
            << tranche::schema::to_string(vault.remaining_fees) << '\n';
  if (vault.dispute) {
    const auto& dispute = *vault.dispute;
    std::cout << "dispute " << dispute.dispute_id << ": "
              << to_string(tranche::schema::current_phase(vault))
              << " initiator " << tranche::schema::to_hex(dispute.initiator)
              << " collateral "
              << tranche::schema::to_string(dispute.initiation_amount)
              << " ends " << dispute.end_time << " accept "
              << tranche::schema::to_string(dispute.accept_weight)
              << " decline "
              << tranche::schema::to_string(dispute.decline_weight) << '\n';
  }
  for (const auto& account : accounts) {
    std::cout << "account " << tranche::schema::to_hex(account) << '\n';
    for (const auto asset : {tranche::schema::asset_kind_t::base,
                             tranche::schema::asset_kind_t::governance,
                             tranche::schema::asset_kind_t::c_token,
                             tranche::schema::asset_kind_t::i_token}) {
      std::cout << "  " << to_string(asset) << ": "
                << tranche::schema::to_string(engine.balance_of(asset, account))
                << '\n';
    }
    std::cout << "  owed fees: "
              << tranche::schema::to_string(engine.owed_fees(account)) << '\n'
              << "  base reward: "
              << tranche::schema::to_string(engine.pending_base_reward(account))
              << '\n'
              << "  governance reward: "
              << tranche::schema::to_string(
                     engine.pending_governance_reward(account))
              << '\n';
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("tranche.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto config_path = std::string{};
  auto db_path = std::string{};
  auto vault_account = std::string{};
  auto zero_vote_policy = std::string{};
  auto config = tranche::schema::vault_config_t{};
  auto block_time = tranche::schema::timestamp_seconds_t{};
  auto height = uint64_t{};

  auto description = po::options_description{"Tranche"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with any of the options below")(
      "db-path", po::value<std::string>(&db_path)->default_value("tranche.db"),
      "RocksDB directory")("vault-account",
                           po::value<std::string>(&vault_account)
                               ->default_value("tranche.vault"),
                           "Vault custody account (hex or name)")(
      "oracle-condition",
      po::value<std::string>(&config.oracle_condition)->default_value(""),
      "Description of the tracked condition")(
      "fee-denominator",
      po::value<uint64_t>(&config.fee_denominator)
          ->default_value(tranche::schema::kDefaultFeeDenominator),
      "Issuance fee is amount / fee-denominator")(
      "initiation-denominator",
      po::value<uint64_t>(&config.initiation_amount_denominator)
          ->default_value(tranche::schema::kDefaultInitiationAmountDenominator),
      "Dispute collateral is iToken supply / initiation-denominator")(
      "dispute-duration",
      po::value<uint64_t>(&config.dispute_duration)
          ->default_value(tranche::schema::kDefaultDisputeDuration),
      "Voting window in seconds")(
      "zero-vote-policy",
      po::value<std::string>(&zero_vote_policy)
          ->default_value("refund_initiator"),
      "reject|refund_initiator")(
      "genesis", po::value<std::vector<std::string>>()->composing(),
      "Genesis allocation asset:account:amount (repeatable)")(
      "height", po::value<uint64_t>(&height),
      "Block height (default: last committed + 1)")(
      "block-time", po::value<uint64_t>(&block_time),
      "Block time in seconds; required when --tx is given")(
      "tx", po::value<std::vector<std::string>>()->composing(),
      "Hex SCALE transaction (repeatable)")(
      "account", po::value<std::vector<std::string>>()->composing(),
      "Account to report balances for (repeatable)")(
      "verbose,v", "Enable verbose output");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto file = std::ifstream{vm["config"].as<std::string>()};
      if (!file) {
        std::cerr << "cannot open config file "
                  << vm["config"].as<std::string>() << '\n';
        return 1;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << '\n';
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  config.vault_account = parse_account(vault_account, "vault-account");
  auto policy = tranche::schema::try_from_string<
      tranche::schema::zero_vote_policy_t>(zero_vote_policy);
  if (!policy) {
    tranche::common::critical("zero-vote-policy must be reject|"
                              "refund_initiator");
  }
  config.zero_vote_policy = *policy;

  auto genesis = std::vector<tranche::schema::genesis_allocation_t>{};
  if (vm.contains("genesis")) {
    for (const auto& value : vm["genesis"].as<std::vector<std::string>>()) {
      genesis.push_back(parse_genesis(value));
    }
  }

  auto app = tranche::node::application{db_path, config, genesis};

  auto txs = std::vector<tranche::schema::bytes_t>{};
  if (vm.contains("tx")) {
    for (const auto& value : vm["tx"].as<std::vector<std::string>>()) {
      auto bytes = tranche::schema::try_from_hex(value);
      if (!bytes) {
        tranche::common::critical("--tx '{}' is not hex", value);
      }
      txs.push_back(std::move(*bytes));
    }
  }

  if (!txs.empty() || vm.contains("height")) {
    if (!vm.contains("block-time")) {
      tranche::common::critical("--block-time is required to apply a block");
    }
    if (!vm.contains("height")) {
      height = app.info().last_block_height + 1;
    }
    auto block = app.finalize_block(height, block_time, txs);
    auto committed = app.commit();
    print_block(block);
    std::cout << "committed height " << committed.committed_height
              << " state root " << tranche::schema::to_hex(committed.state_root)
              << '\n';
  } else {
    auto info = app.info();
    std::cout << info.data << ' ' << info.app_version << " at height "
              << info.last_block_height << " state root "
              << tranche::schema::to_hex(info.last_block_state_root) << '\n';
  }

  auto accounts = std::vector<tranche::schema::account_id_t>{};
  if (vm.contains("account")) {
    for (const auto& value : vm["account"].as<std::vector<std::string>>()) {
      accounts.push_back(parse_account(value, "account"));
    }
  }
  print_vault(app.engine(), accounts);

  spdlog::shutdown();
  return 0;
}
