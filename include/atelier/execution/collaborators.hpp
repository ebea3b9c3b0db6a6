#pragma once

#include <atelier/schema/escrow_event.hpp>
#include <atelier/schema/primitives.hpp>
#include <atelier/schema/transfer_result.hpp>
#include <atelier/storage/storage.hpp>
#include <functional>

// Host capabilities the escrow engine consumes. None of them is implemented
// by the engine itself.
namespace atelier::execution {

/// Answers whether `principal` authorized the current call.
using authorization_gate_t =
    std::function<bool(const atelier::schema::principal_id_t& principal)>;

/// Current host time in unix seconds.
using clock_fn_t = std::function<atelier::schema::timestamp_seconds_t()>;

/// Fire-and-forget notification channel.
using event_sink_t =
    std::function<void(const atelier::schema::escrow_event_t& event)>;

/// Checks an ed25519 signature by `signer` over `message`.
using signature_verifier_t =
    std::function<bool(const atelier::schema::bytes_view_t& message,
                       const atelier::schema::principal_id_t& signer,
                       const atelier::schema::ed25519_signature_t& signature)>;

/// Moves a fixed amount of one asset between two principals, atomically.
///
/// `authorized` is the gate of the call on whose behalf value moves; a
/// ledger must refuse to debit a principal the gate does not authorize.
class value_ledger {
 public:
  virtual ~value_ledger() = default;

  /// Apply the transfer and `writes` durably as one step. A refused
  /// transfer applies neither.
  virtual atelier::schema::transfer_result_t transfer(
      const authorization_gate_t& authorized,
      const atelier::schema::asset_id_t& asset,
      const atelier::schema::principal_id_t& from,
      const atelier::schema::principal_id_t& to,
      const atelier::schema::amount_t& amount,
      const atelier::storage::write_set& writes) = 0;
};

}  // namespace atelier::execution
