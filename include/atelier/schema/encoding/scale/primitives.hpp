#pragma once
#include <atelier/schema/primitives.hpp>
#include <scale/scale.hpp>

// amount_t is a boost multiprecision type, which SCALE does not know. It is
// carried as its 16-byte two's complement image.
namespace atelier::schema::encoding::scale {

inline void encode_amount(const amount_t& amount,
                          ::scale::ScaleEncoder auto& encoder) {
  encode(to_amount_bytes(amount), encoder);
}

inline void decode_amount(amount_t& amount,
                          ::scale::ScaleDecoder auto& decoder) {
  auto image = amount_bytes_t{};
  decode(image, decoder);
  amount = from_amount_bytes(image);
}

}  // namespace atelier::schema::encoding::scale
