#pragma once

#include <atelier/schema/enum_string.hpp>

#include <cstdint>
#include <string>
#include <string_view>

// Schema type: transfer result.
// Outcome reported by a value ledger for one transfer. Non-ok results are
// surfaced to escrow callers unchanged as transfer errors.
namespace atelier::schema {

enum class transfer_error_code : uint32_t {
  ok = 0,
  insufficient_balance = 1,
  unauthorized = 2,
  invalid_amount = 3,
  unavailable = 4,
};

inline constexpr auto kTransferErrorCodeNames =
    enum_names_t<transfer_error_code, 5>{
        {{"ok", transfer_error_code::ok},
         {"insufficient_balance", transfer_error_code::insufficient_balance},
         {"unauthorized", transfer_error_code::unauthorized},
         {"invalid_amount", transfer_error_code::invalid_amount},
         {"unavailable", transfer_error_code::unavailable}}};

inline constexpr std::string_view to_string(const transfer_error_code value) {
  return lookup_name(value, kTransferErrorCodeNames);
}

struct transfer_result_t final {
  transfer_error_code code{transfer_error_code::ok};
  std::string reason;

  bool ok() const { return code == transfer_error_code::ok; }
};

}  // namespace atelier::schema
