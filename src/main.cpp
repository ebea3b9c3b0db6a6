#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atelier/blake3/hash.hpp>
#include <atelier/config/config.hpp>
#include <atelier/crypto/verify.hpp>
#include <atelier/execution/engine.hpp>
#include <atelier/ledger/storage_ledger.hpp>
#include <boost/program_options.hpp>
#include <chrono>
#include <iostream>
#include <limits>
#include <string>

namespace po = boost::program_options;
using namespace atelier::schema;

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

constexpr auto kUsageError = static_cast<int>(escrow_error_code::validation);

int exit_code(const escrow_error_code code) {
  return static_cast<int>(code);
}

void install_logger(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "atelier", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

/// 32-byte hex is taken as-is; anything else names an asset by its hash.
asset_id_t parse_asset(const std::string& text) {
  if (auto asset = try_make_hash32(text)) {
    return *asset;
  }
  return atelier::blake3::hash(text);
}

std::optional<principal_id_t> parse_principal(const po::variables_map& vm,
                                              const char* name) {
  if (!vm.contains(name)) {
    std::cerr << "missing --" << name << '\n';
    return std::nullopt;
  }
  auto principal = try_make_hash32(vm[name].as<std::string>());
  if (!principal) {
    std::cerr << "--" << name << " must be 32 bytes of hex\n";
  }
  return principal;
}

std::optional<atelier::crypto::keypair_t> parse_signer(
    const po::variables_map& vm) {
  if (!vm.contains("secret-key")) {
    std::cerr << "missing --secret-key\n";
    return std::nullopt;
  }
  auto secret = try_make_hash32(vm["secret-key"].as<std::string>());
  if (!secret) {
    std::cerr << "--secret-key must be 32 bytes of hex\n";
    return std::nullopt;
  }
  auto keypair = atelier::crypto::keypair_from_secret(*secret);
  if (!keypair) {
    std::cerr << "--secret-key is not a usable ed25519 key\n";
  }
  return keypair;
}

std::optional<amount_t> parse_amount(const po::variables_map& vm) {
  if (!vm.contains("amount")) {
    std::cerr << "missing --amount\n";
    return std::nullopt;
  }
  auto amount = try_parse_amount(vm["amount"].as<std::string>());
  if (!amount) {
    std::cerr << "--amount must be a decimal integer\n";
  }
  return amount;
}

std::optional<uint64_t> parse_number(const po::variables_map& vm,
                                     const char* name) {
  if (!vm.contains(name)) {
    std::cerr << "missing --" << name << '\n';
    return std::nullopt;
  }
  auto number = try_parse_unsigned(vm[name].as<std::string>());
  if (!number) {
    std::cerr << "--" << name << " must be an unsigned decimal integer\n";
  }
  return number;
}

timestamp_seconds_t wall_clock_seconds() {
  return static_cast<timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

void print_event(const escrow_event_t& event) {
  std::cout << event_name(event) << " escrow=" << event_escrow_id(event)
            << '\n';
}

int report(const operation_result_t& result) {
  std::cout << result.codespace << ": " << to_string(result.code) << " ("
            << result.log << ")";
  if (!result.info.empty()) {
    std::cout << " " << result.info;
  }
  if (result.escrow_id) {
    std::cout << " id=" << *result.escrow_id;
  }
  std::cout << '\n';
  for (const auto& event : result.events) {
    print_event(event);
  }
  return exit_code(result.code);
}

/// Sign `payload` with `signer` and run it through the raw-bytes entry point.
int submit(atelier::execution::engine& engine,
           encoder_t& encoder,
           const atelier::crypto::keypair_t& signer,
           transaction_payload_t payload) {
  auto tx = transaction_t{};
  tx.signer = signer.public_key;
  tx.payload = std::move(payload);
  auto hash = atelier::execution::make_signing_hash(tx);
  auto signature = atelier::crypto::sign(bytes_view_t{hash.data(), hash.size()},
                                         signer.secret_key);
  if (!signature) {
    spdlog::error("Failed to sign transaction");
    return kUsageError;
  }
  tx.signature = *signature;
  auto raw = encoder.encode(tx);
  return report(engine.execute(bytes_view_t{raw.data(), raw.size()}));
}

int run_keygen() {
  auto keypair = atelier::crypto::generate_keypair();
  if (!keypair) {
    spdlog::error("ed25519 key generation is unavailable");
    return kUsageError;
  }
  std::cout << "secret-key: "
            << to_hex(bytes_view_t{keypair->secret_key.data(),
                                   keypair->secret_key.size()})
            << '\n'
            << "public-key: " << to_hex(keypair->public_key) << '\n';
  return 0;
}

int run_escrow_call(const std::string& command,
                    const po::variables_map& vm,
                    atelier::execution::engine& engine,
                    encoder_t& encoder) {
  auto signer = parse_signer(vm);
  auto id = parse_number(vm, "id");
  if (!signer || !id) {
    return kUsageError;
  }
  if (!vm.contains("asset")) {
    std::cerr << "missing --asset\n";
    return kUsageError;
  }
  auto asset = parse_asset(vm["asset"].as<std::string>());
  if (command == "deposit") {
    return submit(engine, encoder, *signer,
                  deposit_escrow_t{.id = *id, .asset = asset});
  }
  if (command == "release") {
    return submit(engine, encoder, *signer,
                  release_escrow_t{.id = *id, .asset = asset});
  }
  return submit(engine, encoder, *signer,
                reclaim_escrow_t{.id = *id, .asset = asset});
}

int run_initialize(const po::variables_map& vm,
                   atelier::execution::engine& engine,
                   encoder_t& encoder) {
  auto signer = parse_signer(vm);
  auto client = parse_principal(vm, "client");
  auto artisan = parse_principal(vm, "artisan");
  auto amount = parse_amount(vm);
  auto deadline = parse_number(vm, "deadline");
  if (!signer || !client || !artisan || !amount || !deadline) {
    return kUsageError;
  }
  if (!vm.contains("asset")) {
    std::cerr << "missing --asset\n";
    return kUsageError;
  }
  auto request = initialize_escrow_t{};
  request.client = *client;
  request.artisan = *artisan;
  request.asset = parse_asset(vm["asset"].as<std::string>());
  request.amount = *amount;
  request.deadline = *deadline;
  return submit(engine, encoder, *signer, request);
}

int run_mint(const po::variables_map& vm,
             atelier::ledger::storage_ledger& ledger) {
  auto recipient = parse_principal(vm, "recipient");
  auto amount = parse_amount(vm);
  if (!recipient || !amount || !vm.contains("asset")) {
    return kUsageError;
  }
  auto result = ledger.mint(parse_asset(vm["asset"].as<std::string>()),
                            *recipient, *amount);
  if (!result.ok()) {
    std::cout << "mint: " << to_string(result.code) << " (" << result.reason
              << ")\n";
    return exit_code(escrow_error_code::transfer);
  }
  std::cout << "mint: ok\n";
  return 0;
}

int run_show(const po::variables_map& vm, atelier::execution::engine& engine) {
  auto id = parse_number(vm, "id");
  if (!id) {
    return kUsageError;
  }
  auto found = engine.get(*id);
  if (!found.ok()) {
    std::cout << found.codespace << ": " << to_string(found.code) << " ("
              << found.log << ")\n";
    return exit_code(found.code);
  }
  const auto& escrow = found.escrow;
  std::cout << "id: " << escrow->id << '\n'
            << "status: " << to_string(escrow->status) << '\n'
            << "client: " << to_hex(escrow->client) << '\n'
            << "artisan: " << to_hex(escrow->artisan) << '\n'
            << "asset: " << to_hex(escrow->asset) << '\n'
            << "amount: " << to_string(escrow->amount) << '\n'
            << "deadline: " << escrow->deadline << '\n';
  return 0;
}

int run_balance(const po::variables_map& vm,
                atelier::ledger::storage_ledger& ledger) {
  auto principal = parse_principal(vm, "principal");
  if (!principal || !vm.contains("asset")) {
    return kUsageError;
  }
  auto amount =
      ledger.balance(parse_asset(vm["asset"].as<std::string>()), *principal);
  std::cout << to_string(amount) << '\n';
  return 0;
}

int run_events(const po::variables_map& vm,
               atelier::execution::engine& engine) {
  auto from = vm.contains("from") ? parse_number(vm, "from") : uint64_t{1};
  auto last = vm.contains("last") ? parse_number(vm, "last")
                                  : std::numeric_limits<uint64_t>::max();
  if (!from || !last) {
    return kUsageError;
  }
  for (const auto& record : engine.events(*from, *last)) {
    std::cout << record.sequence << ' ';
    print_event(record.event);
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto settings = atelier::config::settings{};
  auto command = std::string{};
  auto config_path = std::string{};
  auto log_file = std::string{};

  auto settings_description =
      po::options_description{"Store and engine settings"};
  atelier::config::add_settings_options(settings_description, settings);

  auto description = po::options_description{"Atelier"};
  description.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable verbose output")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with store and engine settings")(
      "log-file",
      po::value<std::string>(&log_file)
          ->default_value(atelier::config::kDefaultLogFile),
      "Log file path")("command", po::value<std::string>(&command),
                       "keygen | initialize | deposit | release | reclaim | "
                       "mint | show | balance | events")(
      "secret-key", po::value<std::string>(), "Signer ed25519 secret (hex)")(
      "client", po::value<std::string>(), "Client principal (hex)")(
      "artisan", po::value<std::string>(), "Artisan principal (hex)")(
      "principal", po::value<std::string>(), "Principal to inspect (hex)")(
      "asset", po::value<std::string>(), "Asset id (hex) or asset name")(
      "amount", po::value<std::string>(), "Amount (decimal)")(
      "recipient", po::value<std::string>(), "Mint recipient (hex)")(
      "deadline", po::value<std::string>(), "Deadline (unix seconds)")(
      "id", po::value<std::string>(), "Escrow id")(
      "from", po::value<std::string>(), "First event sequence")(
      "last", po::value<std::string>(), "Last event sequence");
  description.add(settings_description);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config") &&
        !atelier::config::store_config_file(vm["config"].as<std::string>(),
                                            settings_description, vm)) {
      return kUsageError;
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n' << description << std::endl;
    return kUsageError;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return command.empty() && !vm.contains("help") ? kUsageError : 0;
  }

  install_logger(log_file, vm.contains("verbose"));
  if (auto problem = atelier::config::validate(settings)) {
    spdlog::error("Invalid configuration: {}", *problem);
    spdlog::shutdown();
    return kUsageError;
  }

  if (command == "keygen") {
    auto code = run_keygen();
    spdlog::shutdown();
    return code;
  }

  auto encoder = encoder_t{};
  auto storage = atelier::storage::make_storage<
      atelier::storage::rocksdb_storage_tag>(settings.db_path);
  auto ledger = atelier::ledger::storage_ledger{encoder, storage};
  auto engine = atelier::execution::engine{
      encoder,
      storage,
      ledger,
      wall_clock_seconds,
      [](const escrow_event_t& event) {
        spdlog::info("Event {} for escrow {}", event_name(event),
                     event_escrow_id(event));
      },
      atelier::config::make_engine_options(settings)};

  auto code = kUsageError;
  if (command == "initialize") {
    code = run_initialize(vm, engine, encoder);
  } else if (command == "deposit" || command == "release" ||
             command == "reclaim") {
    code = run_escrow_call(command, vm, engine, encoder);
  } else if (command == "mint") {
    code = run_mint(vm, ledger);
  } else if (command == "show") {
    code = run_show(vm, engine);
  } else if (command == "balance") {
    code = run_balance(vm, ledger);
  } else if (command == "events") {
    code = run_events(vm, engine);
  } else {
    std::cerr << "unknown command '" << command << "'\n";
  }

  spdlog::shutdown();
  return code;
}
