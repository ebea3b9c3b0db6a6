#pragma once
#include <atelier/schema/primitives.hpp>
#include <optional>
#include <span>

namespace atelier::schema::encoding {

// Wire codec selected at build time by tag. Only SCALE is provided; storage
// keys, stored records and signed transactions all go through it.
template <typename Library>
struct encoder {
  template <typename T>
  atelier::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, atelier::schema::bytes_t& out);

  template <typename T>
  T decode(const atelier::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const atelier::schema::bytes_view_t& bytes);
};

}  // namespace atelier::schema::encoding
