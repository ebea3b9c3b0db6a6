#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace atelier::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Principals are ed25519 public keys.
using principal_id_t = hash32_t;
using asset_id_t = hash32_t;
using escrow_id_t = uint64_t;
using amount_t = boost::multiprecision::int128_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

using ed25519_signature_t = std::array<uint8_t, 64>;

// Two's complement little-endian image of an amount, used on the wire.
using amount_bytes_t = std::array<uint8_t, 16>;

// Boost's int128_t is sign-magnitude and reaches 2^128 - 1; amounts are
// limited to what the 16-byte image holds.
inline const amount_t kMaxAmount = (amount_t{1} << 127) - 1;
inline const amount_t kMinAmount = -kMaxAmount - 1;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
std::optional<hash32_t> try_make_hash32(const std::string_view hex);
hash32_t make_zero_hash();

bool in_amount_range(const amount_t& amount);

/// `amount` must satisfy in_amount_range.
amount_bytes_t to_amount_bytes(const amount_t& amount);
amount_t from_amount_bytes(const amount_bytes_t& bytes);
std::optional<amount_t> try_parse_amount(const std::string_view text);
/// Plain decimal digits only; signs, whitespace and trailing text fail.
std::optional<uint64_t> try_parse_unsigned(const std::string_view text);
std::string to_string(const amount_t& amount);

}  // namespace atelier::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
