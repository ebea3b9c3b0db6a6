#pragma once
#include <atelier/schema/encoding/scale/primitives.hpp>
#include <atelier/schema/escrow_event.hpp>
#include <scale/scale.hpp>

// Events that carry an amount. escrow_initialized_t and event_record<1> use
// the default aggregate encoding.
namespace atelier::schema {

inline void encode(const escrow_funded_t& o,
                   ::scale::ScaleEncoder auto& encoder) {
  encode(o.id, encoder);
  encode(o.client, encoder);
  encoding::scale::encode_amount(o.amount, encoder);
  encode(o.timestamp, encoder);
}

inline void decode(escrow_funded_t& o, ::scale::ScaleDecoder auto& decoder) {
  decode(o.id, decoder);
  decode(o.client, decoder);
  encoding::scale::decode_amount(o.amount, decoder);
  decode(o.timestamp, decoder);
}

inline void encode(const escrow_released_t& o,
                   ::scale::ScaleEncoder auto& encoder) {
  encode(o.id, encoder);
  encode(o.artisan, encoder);
  encoding::scale::encode_amount(o.amount, encoder);
  encode(o.timestamp, encoder);
}

inline void decode(escrow_released_t& o, ::scale::ScaleDecoder auto& decoder) {
  decode(o.id, decoder);
  decode(o.artisan, decoder);
  encoding::scale::decode_amount(o.amount, decoder);
  decode(o.timestamp, decoder);
}

inline void encode(const escrow_reclaimed_t& o,
                   ::scale::ScaleEncoder auto& encoder) {
  encode(o.id, encoder);
  encode(o.client, encoder);
  encoding::scale::encode_amount(o.amount, encoder);
  encode(o.timestamp, encoder);
}

inline void decode(escrow_reclaimed_t& o,
                   ::scale::ScaleDecoder auto& decoder) {
  decode(o.id, decoder);
  decode(o.client, decoder);
  encoding::scale::decode_amount(o.amount, decoder);
  decode(o.timestamp, decoder);
}

}  // namespace atelier::schema
