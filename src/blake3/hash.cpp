#include <blake3.h>
#include <atelier/blake3/hash.hpp>

namespace atelier::blake3 {

namespace {

atelier::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = atelier::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<atelier::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

atelier::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

atelier::schema::hash32_t hash(const atelier::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace atelier::blake3
