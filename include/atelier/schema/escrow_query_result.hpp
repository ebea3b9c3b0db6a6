#pragma once

#include <atelier/schema/escrow_error_code.hpp>
#include <atelier/schema/escrow_state.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace atelier::schema {

template <uint16_t Version>
struct escrow_query_result;

template <>
struct escrow_query_result<1> final {
  uint16_t version{1};
  escrow_error_code code{escrow_error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<escrow_state_t> escrow;

  bool ok() const { return code == escrow_error_code::ok; }
};

using escrow_query_result_t = escrow_query_result<1>;

}  // namespace atelier::schema
