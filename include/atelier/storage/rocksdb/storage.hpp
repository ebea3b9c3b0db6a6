#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <atelier/common/critical.hpp>
#include <atelier/schema/encoding/scale/encoder.hpp>
#include <atelier/schema/key/engine_keys.hpp>
#include <atelier/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace atelier::storage {

namespace detail {

using encoder_t = atelier::schema::encoding::encoder<
    atelier::schema::encoding::scale_encoder_tag>;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const atelier::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline void require_open(
    const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    atelier::common::critical("escrow store is not open");
  }
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const atelier::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const atelier::schema::bytes_view_t& key,
           const T& value) const;

  void commit(const write_set& writes) const;
  std::optional<atelier::schema::timestamp_seconds_t> load_retention(
      const atelier::schema::bytes_view_t& key) const;
  void extend_retention(
      write_set& writes,
      const atelier::schema::bytes_view_t& key,
      atelier::schema::timestamp_seconds_t now,
      atelier::schema::duration_seconds_t renewal_threshold,
      atelier::schema::duration_seconds_t target_retention) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const atelier::schema::bytes_view_t& key) const {
  detail::require_open(database);
  auto stored = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &stored);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    atelier::common::critical("escrow store read failed: {}",
                              status.ToString());
  }
  auto record = encoder.template try_decode<T>(
      atelier::schema::make_bytes_view(std::string_view{stored}));
  if (!record) {
    atelier::common::critical("corrupt record under key {}",
                              atelier::schema::to_hex(key));
  }
  return record;
}

/// Single-key write; goes through the same batch path as commit.
template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const atelier::schema::bytes_view_t& key,
                                       const T& value) const {
  auto writes = write_set{};
  writes.put(encoder, key, value);
  commit(writes);
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_set& writes) const {
  detail::require_open(database);
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes.entries) {
    auto put_status = batch.Put(
        detail::to_slice(atelier::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            atelier::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      atelier::common::critical("failed staging key in write batch: {}",
                                put_status.ToString());
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    atelier::common::critical("failed to commit write batch: {}",
                              write_status.ToString());
  }
  spdlog::debug("Committed {} key(s)", writes.entries.size());
}

inline std::optional<atelier::schema::timestamp_seconds_t>
storage<rocksdb_storage_tag>::load_retention(
    const atelier::schema::bytes_view_t& key) const {
  auto encoder = detail::encoder_t{};
  auto retention_key = atelier::schema::key::make_retention_key(key);
  return get<atelier::schema::timestamp_seconds_t>(
      encoder, atelier::schema::bytes_view_t{retention_key.data(),
                                             retention_key.size()});
}

inline void storage<rocksdb_storage_tag>::extend_retention(
    write_set& writes,
    const atelier::schema::bytes_view_t& key,
    const atelier::schema::timestamp_seconds_t now,
    const atelier::schema::duration_seconds_t renewal_threshold,
    const atelier::schema::duration_seconds_t target_retention) const {
  auto expires_at = load_retention(key);
  if (expires_at.has_value() && *expires_at > now &&
      (*expires_at - now) >= renewal_threshold) {
    return;
  }
  auto encoder = detail::encoder_t{};
  auto retention_key = atelier::schema::key::make_retention_key(key);
  writes.put(encoder,
             atelier::schema::bytes_view_t{retention_key.data(),
                                           retention_key.size()},
             atelier::schema::timestamp_seconds_t{now + target_retention});
}

}  // namespace atelier::storage
