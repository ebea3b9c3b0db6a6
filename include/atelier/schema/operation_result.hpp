#pragma once

#include <atelier/schema/escrow_error_code.hpp>
#include <atelier/schema/escrow_event.hpp>
#include <atelier/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atelier::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  escrow_error_code code{escrow_error_code::ok};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<escrow_id_t> escrow_id;
  std::vector<escrow_event_t> events;

  bool ok() const { return code == escrow_error_code::ok; }
};

using operation_result_t = operation_result<1>;

}  // namespace atelier::schema
