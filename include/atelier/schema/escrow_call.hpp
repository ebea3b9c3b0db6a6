#pragma once
#include <atelier/schema/primitives.hpp>

// Payloads addressing an existing escrow by id. Each carries the asset the
// caller expects to move; it must match the escrow's stored asset.
namespace atelier::schema {

template <uint16_t Version>
struct deposit_escrow;

template <>
struct deposit_escrow<1> final {
  uint16_t version{1};
  escrow_id_t id{};
  asset_id_t asset{};
};

template <uint16_t Version>
struct release_escrow;

template <>
struct release_escrow<1> final {
  uint16_t version{1};
  escrow_id_t id{};
  asset_id_t asset{};
};

template <uint16_t Version>
struct reclaim_escrow;

template <>
struct reclaim_escrow<1> final {
  uint16_t version{1};
  escrow_id_t id{};
  asset_id_t asset{};
};

using deposit_escrow_t = deposit_escrow<1>;
using release_escrow_t = release_escrow<1>;
using reclaim_escrow_t = reclaim_escrow<1>;

}  // namespace atelier::schema
