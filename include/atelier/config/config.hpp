#pragma once

#include <atelier/execution/engine_options.hpp>
#include <atelier/schema/primitives.hpp>
#include <boost/program_options.hpp>
#include <istream>
#include <optional>
#include <string>

namespace atelier::config {

inline constexpr auto kDefaultDbPath = "./atelier-db";
inline constexpr auto kDefaultCustodySeed = "atelier-custody";
inline constexpr auto kDefaultLogFile = "atelier.log";

struct settings final {
  std::string db_path{kDefaultDbPath};
  atelier::schema::duration_seconds_t renewal_threshold{
      atelier::execution::kDefaultRenewalThreshold};
  atelier::schema::duration_seconds_t target_retention{
      atelier::execution::kDefaultTargetRetention};
  std::string custody_seed{kDefaultCustodySeed};
  bool strict_crypto{true};
};

/// Register store and engine settings on `description`, bound to `out`.
///
/// These keys are accepted both on the command line and in a config file.
void add_settings_options(
    boost::program_options::options_description& description,
    settings& out);

/// Store INI-style settings from `in` into `vm`.
///
/// Values already present in `vm` (e.g. from the command line) win.
void store_config_stream(
    std::istream& in,
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm);

/// Same as store_config_stream, reading the file at `path`.
///
/// Returns false when the file cannot be opened.
bool store_config_file(
    const std::string& path,
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm);

/// Human-readable problem with `value`, or std::nullopt when usable.
std::optional<std::string> validate(const settings& value);

/// Engine options for `value`; the custody principal is derived from the
/// custody seed.
atelier::execution::engine_options make_engine_options(const settings& value);

}  // namespace atelier::config
