#pragma once

#include <atelier/execution/collaborators.hpp>
#include <atelier/schema/encoding/scale/encoder.hpp>
#include <atelier/schema/primitives.hpp>
#include <atelier/schema/transfer_result.hpp>
#include <atelier/storage/rocksdb/storage.hpp>
#include <mutex>

namespace atelier::ledger {

/// Fungible balance book kept in the escrow store.
///
/// Balances are tracked per (asset, principal). A transfer debits, credits
/// and applies the caller's staged writes in one write batch.
class storage_ledger final : public atelier::execution::value_ledger {
 public:
  storage_ledger(
      atelier::schema::encoding::encoder<
          atelier::schema::encoding::scale_encoder_tag>& encoder,
      atelier::storage::storage<atelier::storage::rocksdb_storage_tag>&
          storage);

  atelier::schema::transfer_result_t transfer(
      const atelier::execution::authorization_gate_t& authorized,
      const atelier::schema::asset_id_t& asset,
      const atelier::schema::principal_id_t& from,
      const atelier::schema::principal_id_t& to,
      const atelier::schema::amount_t& amount,
      const atelier::storage::write_set& writes) override;

  /// Transfer with nothing else riding in the batch.
  atelier::schema::transfer_result_t transfer(
      const atelier::execution::authorization_gate_t& authorized,
      const atelier::schema::asset_id_t& asset,
      const atelier::schema::principal_id_t& from,
      const atelier::schema::principal_id_t& to,
      const atelier::schema::amount_t& amount);

  /// Credit newly issued value to `to`.
  atelier::schema::transfer_result_t mint(
      const atelier::schema::asset_id_t& asset,
      const atelier::schema::principal_id_t& to,
      const atelier::schema::amount_t& amount);

  atelier::schema::amount_t balance(
      const atelier::schema::asset_id_t& asset,
      const atelier::schema::principal_id_t& principal) const;

 private:
  atelier::schema::amount_t load_balance(
      const atelier::schema::asset_id_t& asset,
      const atelier::schema::principal_id_t& principal) const;

  mutable std::mutex mutex_;
  atelier::schema::encoding::encoder<
      atelier::schema::encoding::scale_encoder_tag>& encoder_;
  atelier::storage::storage<atelier::storage::rocksdb_storage_tag>& storage_;
};

}  // namespace atelier::ledger
