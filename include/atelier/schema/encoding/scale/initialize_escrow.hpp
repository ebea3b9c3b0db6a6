#pragma once
#include <atelier/schema/encoding/scale/primitives.hpp>
#include <atelier/schema/initialize_escrow.hpp>
#include <scale/scale.hpp>

namespace atelier::schema {

inline void encode(const initialize_escrow<1>& o,
                   ::scale::ScaleEncoder auto& encoder) {
  encode(o.version, encoder);
  encode(o.client, encoder);
  encode(o.artisan, encoder);
  encode(o.asset, encoder);
  encoding::scale::encode_amount(o.amount, encoder);
  encode(o.deadline, encoder);
}

inline void decode(initialize_escrow<1>& o,
                   ::scale::ScaleDecoder auto& decoder) {
  decode(o.version, decoder);
  decode(o.client, decoder);
  decode(o.artisan, decoder);
  decode(o.asset, decoder);
  encoding::scale::decode_amount(o.amount, decoder);
  decode(o.deadline, decoder);
}

}  // namespace atelier::schema
