#pragma once
#include <atelier/schema/escrow_status.hpp>
#include <atelier/schema/primitives.hpp>

namespace atelier::schema {

template <uint16_t Version>
struct escrow_state;

template <>
struct escrow_state<1> final {
  uint16_t version{1};
  escrow_id_t id{};
  principal_id_t client{};
  principal_id_t artisan{};
  asset_id_t asset{};
  amount_t amount{};
  timestamp_seconds_t deadline{};
  escrow_status_t status{escrow_status_t::pending};

  bool operator==(const escrow_state<1>&) const = default;
};

using escrow_state_t = escrow_state<1>;

}  // namespace atelier::schema
