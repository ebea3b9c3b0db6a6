#pragma once

#include <atelier/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: escrow status.
// Escrow workflow: pending -> funded -> released | refunded. `disputed` is
// reserved; no operation enters or leaves it.
namespace atelier::schema {

enum class escrow_status_t : uint8_t {
  pending = 0,
  funded = 1,
  released = 2,
  refunded = 3,
  disputed = 4
};

inline constexpr auto kEscrowStatusNames = enum_names_t<escrow_status_t, 5>{
    {{"pending", escrow_status_t::pending},
     {"funded", escrow_status_t::funded},
     {"released", escrow_status_t::released},
     {"refunded", escrow_status_t::refunded},
     {"disputed", escrow_status_t::disputed}}};

inline constexpr std::string_view to_string(const escrow_status_t value) {
  return lookup_name(value, kEscrowStatusNames);
}

inline constexpr std::optional<escrow_status_t> try_escrow_status_from_string(
    const std::string_view value) {
  return lookup_value(value, kEscrowStatusNames);
}

inline constexpr bool is_terminal(const escrow_status_t value) {
  return value == escrow_status_t::released ||
         value == escrow_status_t::refunded;
}

}  // namespace atelier::schema
