#pragma once
#include <atelier/schema/primitives.hpp>

namespace atelier::schema {

template <uint16_t Version>
struct initialize_escrow;

template <>
struct initialize_escrow<1> final {
  uint16_t version{1};
  principal_id_t client{};
  principal_id_t artisan{};
  asset_id_t asset{};
  amount_t amount{};
  timestamp_seconds_t deadline{};
};

using initialize_escrow_t = initialize_escrow<1>;

}  // namespace atelier::schema
