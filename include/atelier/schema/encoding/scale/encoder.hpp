#pragma once
#include <atelier/common/critical.hpp>
#include <atelier/schema/encoding/encoder.hpp>
#include <atelier/schema/encoding/scale/escrow_event.hpp>
#include <atelier/schema/encoding/scale/escrow_state.hpp>
#include <atelier/schema/encoding/scale/initialize_escrow.hpp>
#include <atelier/schema/encoding/scale/primitives.hpp>
#include <atelier/schema/transaction.hpp>
#include <iterator>
#include <utility>
#include <scale/scale.hpp>

namespace atelier::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  atelier::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, atelier::schema::bytes_t& out);

  template <typename T>
  T decode(const atelier::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const atelier::schema::bytes_view_t& bytes);
};

template <typename T>
atelier::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto out = atelier::schema::bytes_t{};
  encode(obj, out);
  return out;
}

/// Appends the encoding of `obj` to `out`; key builders rely on this to
/// concatenate fields.
template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        atelier::schema::bytes_t& out) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    atelier::common::critical("SCALE encoding failed: {}",
                              encoded.error().message());
  }
  out.insert(std::end(out), std::begin(encoded.value()),
             std::end(encoded.value()));
}

/// Decode trusted bytes (our own stored records); failure is fatal.
template <typename T>
T encoder<scale_encoder_tag>::decode(
    const atelier::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    atelier::common::critical("SCALE decoding failed for {} byte(s)",
                              bytes.size());
  }
  return std::move(*decoded);
}

/// Decode untrusted bytes; std::nullopt on any malformed input.
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const atelier::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace atelier::schema::encoding
