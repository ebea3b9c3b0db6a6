#pragma once

#include <atelier/execution/collaborators.hpp>
#include <atelier/execution/engine_options.hpp>
#include <atelier/schema/encoding/scale/encoder.hpp>
#include <atelier/schema/escrow_event.hpp>
#include <atelier/schema/escrow_query_result.hpp>
#include <atelier/schema/escrow_state.hpp>
#include <atelier/schema/initialize_escrow.hpp>
#include <atelier/schema/operation_result.hpp>
#include <atelier/schema/primitives.hpp>
#include <atelier/schema/transaction.hpp>
#include <atelier/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace atelier::execution {

/// Hash an ed25519 signer signs for `tx`: BLAKE3 over the SCALE encoding of
/// (version, signer, payload).
atelier::schema::hash32_t make_signing_hash(
    const atelier::schema::transaction_t& tx);

/// Escrow lifecycle state machine.
///
/// Owns escrow records, the id counter and the event log. Each mutating
/// operation either commits every write in one storage batch together with
/// its ledger move, or returns an error code and leaves nothing behind.
/// Events reach the sink after the batch commits and outside the engine
/// lock, so a sink may call back into the engine.
class engine final {
 public:
  explicit engine(
      atelier::schema::encoding::encoder<
          atelier::schema::encoding::scale_encoder_tag>& encoder,
      atelier::storage::storage<atelier::storage::rocksdb_storage_tag>& storage,
      value_ledger& ledger,
      clock_fn_t clock,
      event_sink_t sink,
      engine_options options = {});

  /// Create a Pending escrow and return its id in `escrow_id`.
  ///
  /// Needs no authorization.
  atelier::schema::operation_result_t initialize(
      const atelier::schema::initialize_escrow_t& request);

  /// Move the escrow amount from the client into custody.
  ///
  /// The ledger asks `authorized` whether the client approved the debit.
  atelier::schema::operation_result_t deposit(
      const authorization_gate_t& authorized,
      atelier::schema::escrow_id_t id,
      const atelier::schema::asset_id_t& asset);

  /// Pay a funded escrow out to the artisan. Client only, before deadline.
  atelier::schema::operation_result_t release(
      const authorization_gate_t& authorized,
      atelier::schema::escrow_id_t id,
      const atelier::schema::asset_id_t& asset);

  /// Return a funded escrow to the client. Client only, after deadline.
  atelier::schema::operation_result_t reclaim(
      const authorization_gate_t& authorized,
      atelier::schema::escrow_id_t id,
      const atelier::schema::asset_id_t& asset);

  /// Stored escrow; `not_found` when the id was never allocated.
  atelier::schema::escrow_query_result_t get(
      atelier::schema::escrow_id_t id) const;

  /// Id the next successful initialize will assign.
  atelier::schema::escrow_id_t next_id() const;

  /// Verify and run a signed transaction.
  atelier::schema::operation_result_t execute(
      const atelier::schema::transaction_t& tx);

  /// Decode a SCALE-encoded transaction and run it.
  atelier::schema::operation_result_t execute(
      const atelier::schema::bytes_view_t& raw_tx);

  /// Event log entries with sequence in [from_sequence, to_sequence].
  std::vector<atelier::schema::event_record_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  const engine_options& options() const { return options_; }

 private:
  std::optional<atelier::schema::escrow_state_t> load_escrow(
      atelier::schema::escrow_id_t id) const;
  atelier::schema::escrow_id_t load_next_id() const;
  uint64_t load_next_event_sequence() const;

  /// Stage the escrow record and refresh its retention hint.
  void stage_escrow(atelier::storage::write_set& writes,
                    const atelier::schema::escrow_state_t& escrow,
                    atelier::schema::timestamp_seconds_t now) const;

  /// Append events to the event log inside `writes`.
  void stage_events(
      atelier::storage::write_set& writes,
      const std::vector<atelier::schema::escrow_event_t>& events) const;

  /// Hand each event to the sink; a throwing sink is logged and skipped.
  void publish(
      const std::vector<atelier::schema::escrow_event_t>& events) const;

  /// Ledger move that commits `writes` along with it, or nothing at all.
  std::optional<atelier::schema::operation_result_t> move_value(
      std::string_view codespace,
      const authorization_gate_t& authorized,
      const atelier::schema::escrow_state_t& escrow,
      const atelier::schema::principal_id_t& from,
      const atelier::schema::principal_id_t& to,
      const atelier::storage::write_set& writes);

  authorization_gate_t custody_gate() const;

  mutable std::mutex mutex_;
  atelier::schema::encoding::encoder<
      atelier::schema::encoding::scale_encoder_tag>& encoder_;
  atelier::storage::storage<atelier::storage::rocksdb_storage_tag>& storage_;
  value_ledger& ledger_;
  clock_fn_t clock_;
  event_sink_t sink_;
  engine_options options_;
  signature_verifier_t signature_verifier_;
};

}  // namespace atelier::execution
