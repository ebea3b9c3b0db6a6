#include <atelier/schema/primitives.hpp>

#include <algorithm>
#include <charconv>
#include <iterator>
#include <string_view>

namespace atelier::schema {

namespace {

using wide_unsigned_t = boost::multiprecision::uint128_t;

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<hash32_t> try_make_hash32(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

bool in_amount_range(const amount_t& amount) {
  return amount >= kMinAmount && amount <= kMaxAmount;
}

amount_bytes_t to_amount_bytes(const amount_t& amount) {
  auto image = amount >= 0 ? wide_unsigned_t{amount}
                           : ~wide_unsigned_t{-amount} + 1;
  auto out = amount_bytes_t{};
  for (auto& byte : out) {
    byte = static_cast<uint8_t>(image & 0xFFu);
    image >>= 8;
  }
  return out;
}

amount_t from_amount_bytes(const amount_bytes_t& bytes) {
  auto image = wide_unsigned_t{};
  for (auto it = std::rbegin(bytes); it != std::rend(bytes); ++it) {
    image <<= 8;
    image |= *it;
  }
  if ((bytes.back() & 0x80u) == 0) {
    return amount_t{image};
  }
  return -amount_t{~image + 1};
}

std::optional<amount_t> try_parse_amount(std::string_view text) {
  auto negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  // Anything wider than the amount image is rejected rather than wrapped.
  auto limit = boost::multiprecision::cpp_int{kMaxAmount};
  if (negative) {
    limit += 1;
  }
  auto value = boost::multiprecision::cpp_int{};
  for (const auto c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = (value * 10) + (c - '0');
    if (value > limit) {
      return std::nullopt;
    }
  }
  auto amount = amount_t{value};
  return negative ? amount_t{-amount} : amount;
}

std::optional<uint64_t> try_parse_unsigned(const std::string_view text) {
  if (text.empty() || text.front() < '0' || text.front() > '9') {
    return std::nullopt;
  }
  auto value = uint64_t{};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace atelier::schema
