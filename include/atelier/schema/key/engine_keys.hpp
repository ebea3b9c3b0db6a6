#pragma once

#include <atelier/schema/primitives.hpp>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Escrow workflow: canonical key prefixes and key codecs for escrow state,
// the id counter, the event log, ledger balances and retention hints.
namespace atelier::schema::key {

inline constexpr std::string_view kEscrowKeyPrefix{"SYS|STATE|ESCROW|"};
inline constexpr std::string_view kNextIdKeyPrefix{"SYS|STATE|NEXT_ID|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|LEDGER|BALANCE|"};
inline constexpr std::string_view kRetentionPrefix{"SYS|RETENTION|"};

template <typename Encoder, typename T>
atelier::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
atelier::schema::bytes_t make_escrow_key(Encoder& encoder,
                                         const escrow_id_t id) {
  return make_prefixed_key(encoder, kEscrowKeyPrefix, id);
}

template <typename Encoder>
atelier::schema::bytes_t make_next_id_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kNextIdKeyPrefix,
                           std::string_view{"COUNTER"});
}

template <typename Encoder>
atelier::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
atelier::schema::bytes_t make_event_key(Encoder& encoder,
                                        const uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

template <typename Encoder>
atelier::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const atelier::schema::asset_id_t& asset,
    const atelier::schema::principal_id_t& principal) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix,
                           std::tuple{asset, principal});
}

/// Retention hints are keyed by the raw bytes of the key they describe.
inline atelier::schema::bytes_t make_retention_key(
    const atelier::schema::bytes_view_t& key) {
  auto out = atelier::schema::make_bytes(kRetentionPrefix);
  out.reserve(out.size() + key.size());
  out.insert(std::end(out), std::begin(key), std::end(key));
  return out;
}

}  // namespace atelier::schema::key
