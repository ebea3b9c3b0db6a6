#pragma once

#include <atelier/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

namespace atelier::schema {

enum class escrow_error_code : uint32_t {
  ok = 0,
  validation = 1,
  not_found = 2,
  state = 3,
  deadline = 4,
  authorization = 5,
  transfer = 6,
};

inline constexpr auto kEscrowErrorCodeNames =
    enum_names_t<escrow_error_code, 7>{
        {{"ok", escrow_error_code::ok},
         {"validation_error", escrow_error_code::validation},
         {"not_found_error", escrow_error_code::not_found},
         {"state_error", escrow_error_code::state},
         {"deadline_error", escrow_error_code::deadline},
         {"authorization_error", escrow_error_code::authorization},
         {"transfer_error", escrow_error_code::transfer}}};

inline constexpr std::string_view to_string(const escrow_error_code value) {
  return lookup_name(value, kEscrowErrorCodeNames);
}

}  // namespace atelier::schema
