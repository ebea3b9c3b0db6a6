#include <spdlog/spdlog.h>
#include <atelier/blake3/hash.hpp>
#include <atelier/config/config.hpp>
#include <fstream>

namespace po = boost::program_options;

namespace atelier::config {

void add_settings_options(po::options_description& description,
                          settings& out) {
  description.add_options()(
      "db-path",
      po::value<std::string>(&out.db_path)->default_value(kDefaultDbPath),
      "RocksDB directory")(
      "renewal-threshold",
      po::value<atelier::schema::duration_seconds_t>(&out.renewal_threshold)
          ->default_value(atelier::execution::kDefaultRenewalThreshold),
      "Renew retention hints once fewer seconds than this remain")(
      "target-retention",
      po::value<atelier::schema::duration_seconds_t>(&out.target_retention)
          ->default_value(atelier::execution::kDefaultTargetRetention),
      "Seconds of retention a renewal extends to")(
      "custody-seed",
      po::value<std::string>(&out.custody_seed)
          ->default_value(kDefaultCustodySeed),
      "Seed hashed into the custodial principal")(
      "strict-crypto",
      po::value<bool>(&out.strict_crypto)->default_value(true),
      "Verify transaction signatures");
}

void store_config_stream(std::istream& in,
                         const po::options_description& description,
                         po::variables_map& vm) {
  po::store(po::parse_config_file(in, description), vm);
}

bool store_config_file(const std::string& path,
                       const po::options_description& description,
                       po::variables_map& vm) {
  auto in = std::ifstream{path};
  if (!in) {
    spdlog::error("Cannot open config file '{}'", path);
    return false;
  }
  store_config_stream(in, description, vm);
  spdlog::debug("Loaded config file '{}'", path);
  return true;
}

std::optional<std::string> validate(const settings& value) {
  if (value.db_path.empty()) {
    return "db-path must not be empty";
  }
  if (value.target_retention == 0) {
    return "target-retention must be positive";
  }
  if (value.renewal_threshold > value.target_retention) {
    return "renewal-threshold must not exceed target-retention";
  }
  if (value.custody_seed.empty()) {
    return "custody-seed must not be empty";
  }
  return std::nullopt;
}

atelier::execution::engine_options make_engine_options(const settings& value) {
  auto options = atelier::execution::engine_options{};
  options.custody = atelier::blake3::hash(value.custody_seed);
  options.renewal_threshold = value.renewal_threshold;
  options.target_retention = value.target_retention;
  options.require_strict_crypto = value.strict_crypto;
  return options;
}

}  // namespace atelier::config
