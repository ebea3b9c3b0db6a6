#pragma once
#include <atelier/schema/encoding/scale/primitives.hpp>
#include <atelier/schema/escrow_state.hpp>
#include <scale/scale.hpp>

namespace atelier::schema {

inline void encode(const escrow_state<1>& o,
                   ::scale::ScaleEncoder auto& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.client, encoder);
  encode(o.artisan, encoder);
  encode(o.asset, encoder);
  encoding::scale::encode_amount(o.amount, encoder);
  encode(o.deadline, encoder);
  encode(o.status, encoder);
}

inline void decode(escrow_state<1>& o, ::scale::ScaleDecoder auto& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.client, decoder);
  decode(o.artisan, decoder);
  decode(o.asset, decoder);
  encoding::scale::decode_amount(o.amount, decoder);
  decode(o.deadline, decoder);
  decode(o.status, decoder);
}

}  // namespace atelier::schema
