#pragma once
#include <atelier/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace atelier::storage {

using key_value_entry_t =
    std::pair<atelier::schema::bytes_t, atelier::schema::bytes_t>;

/// Writes staged by one engine operation and committed as a single batch.
struct write_set final {
  std::vector<key_value_entry_t> entries;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const atelier::schema::bytes_view_t& key,
           const T& value) {
    entries.emplace_back(atelier::schema::make_bytes(key),
                         encoder.encode(value));
  }

  bool empty() const { return entries.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const atelier::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const atelier::schema::bytes_view_t& key,
           const T& value) const;

  /// Atomically apply every entry of the write set.
  void commit(const write_set& writes) const;

  /// Expiry currently recorded for key, if any.
  std::optional<atelier::schema::timestamp_seconds_t> load_retention(
      const atelier::schema::bytes_view_t& key) const;

  /// Stage a retention renewal for key into writes.
  ///
  /// Nothing is staged while more than `renewal_threshold` seconds of
  /// retention remain; otherwise the expiry moves to now + target_retention.
  void extend_retention(
      write_set& writes,
      const atelier::schema::bytes_view_t& key,
      atelier::schema::timestamp_seconds_t now,
      atelier::schema::duration_seconds_t renewal_threshold,
      atelier::schema::duration_seconds_t target_retention) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace atelier::storage
