#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <atelier/blake3/hash.hpp>
#include <atelier/crypto/verify.hpp>
#include <atelier/execution/engine.hpp>
#include <atelier/schema/key/engine_keys.hpp>
#include <tuple>
#include <utility>

using namespace atelier::schema;

namespace {

constexpr auto kInitializeCodespace = std::string_view{"atelier.initialize"};
constexpr auto kDepositCodespace = std::string_view{"atelier.deposit"};
constexpr auto kReleaseCodespace = std::string_view{"atelier.release"};
constexpr auto kReclaimCodespace = std::string_view{"atelier.reclaim"};
constexpr auto kExecuteCodespace = std::string_view{"atelier.execute"};
constexpr auto kGetCodespace = std::string_view{"atelier.get"};

operation_result_t make_error_result(const escrow_error_code code,
                                     const std::string_view codespace,
                                     std::string log,
                                     std::string info = {},
                                     std::optional<escrow_id_t> id = {}) {
  spdlog::warn("{} rejected: {} ({}){}", codespace, to_string(code), log,
               info.empty() ? std::string{} : ": " + info);
  auto result = operation_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  result.escrow_id = id;
  return result;
}

operation_result_t make_success_result(const std::string_view codespace,
                                       const escrow_id_t id,
                                       std::vector<escrow_event_t> events) {
  auto result = operation_result_t{};
  result.log = "ok";
  result.codespace = std::string{codespace};
  result.escrow_id = id;
  result.events = std::move(events);
  return result;
}

std::string describe_status(const escrow_status_t status) {
  return "escrow is " + std::string{to_string(status)};
}

}  // namespace

namespace atelier::execution {

hash32_t make_signing_hash(const transaction_t& tx) {
  auto encoder = encoding::encoder<encoding::scale_encoder_tag>{};
  auto message = encoder.encode(std::tuple{tx.version, tx.signer, tx.payload});
  return atelier::blake3::hash(bytes_view_t{message.data(), message.size()});
}

engine::engine(
    encoding::encoder<encoding::scale_encoder_tag>& encoder,
    atelier::storage::storage<atelier::storage::rocksdb_storage_tag>& storage,
    value_ledger& ledger,
    clock_fn_t clock,
    event_sink_t sink,
    engine_options options)
    : encoder_{encoder},
      storage_{storage},
      ledger_{ledger},
      clock_{std::move(clock)},
      sink_{std::move(sink)},
      options_{options},
      signature_verifier_{[](const bytes_view_t& message,
                             const principal_id_t& signer,
                             const ed25519_signature_t& signature) {
        return atelier::crypto::verify_signature(message, signer, signature);
      }} {
  if (!clock_) {
    atelier::common::critical("escrow engine requires a clock");
  }
  if (options_.renewal_threshold > options_.target_retention) {
    atelier::common::critical(
        "renewal threshold must not exceed target retention");
  }
  if (!options_.require_strict_crypto) {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  }
  spdlog::info("Escrow engine ready; custody {} next id {}",
               to_hex(options_.custody), load_next_id());
}

std::optional<escrow_state_t> engine::load_escrow(const escrow_id_t id) const {
  auto key = key::make_escrow_key(encoder_, id);
  return storage_.get<escrow_state_t>(encoder_,
                                      bytes_view_t{key.data(), key.size()});
}

escrow_id_t engine::load_next_id() const {
  auto key = key::make_next_id_key(encoder_);
  return storage_
      .get<escrow_id_t>(encoder_, bytes_view_t{key.data(), key.size()})
      .value_or(escrow_id_t{1});
}

uint64_t engine::load_next_event_sequence() const {
  auto key = key::make_event_sequence_key(encoder_);
  return storage_.get<uint64_t>(encoder_, bytes_view_t{key.data(), key.size()})
      .value_or(uint64_t{1});
}

authorization_gate_t engine::custody_gate() const {
  return [custody = options_.custody](const principal_id_t& principal) {
    return principal == custody;
  };
}

void engine::stage_escrow(atelier::storage::write_set& writes,
                          const escrow_state_t& escrow,
                          const timestamp_seconds_t now) const {
  auto key = key::make_escrow_key(encoder_, escrow.id);
  auto key_view = bytes_view_t{key.data(), key.size()};
  writes.put(encoder_, key_view, escrow);
  storage_.extend_retention(writes, key_view, now, options_.renewal_threshold,
                            options_.target_retention);
}

void engine::stage_events(atelier::storage::write_set& writes,
                          const std::vector<escrow_event_t>& events) const {
  auto sequence = load_next_event_sequence();
  for (const auto& event : events) {
    auto key = key::make_event_key(encoder_, sequence);
    writes.put(encoder_, bytes_view_t{key.data(), key.size()},
               event_record_t{.sequence = sequence, .event = event});
    ++sequence;
  }
  auto sequence_key = key::make_event_sequence_key(encoder_);
  writes.put(encoder_, bytes_view_t{sequence_key.data(), sequence_key.size()},
             sequence);
}

void engine::publish(const std::vector<escrow_event_t>& events) const {
  if (!sink_) {
    return;
  }
  for (const auto& event : events) {
    try {
      sink_(event);
    } catch (const std::exception& e) {
      spdlog::warn("Event sink failed on {} for escrow {}: {}",
                   event_name(event), event_escrow_id(event), e.what());
    }
  }
}

std::optional<operation_result_t> engine::move_value(
    const std::string_view codespace,
    const authorization_gate_t& authorized,
    const escrow_state_t& escrow,
    const principal_id_t& from,
    const principal_id_t& to,
    const atelier::storage::write_set& writes) {
  auto transfer = ledger_.transfer(authorized, escrow.asset, from, to,
                                   escrow.amount, writes);
  if (transfer.ok()) {
    return std::nullopt;
  }
  return make_error_result(escrow_error_code::transfer, codespace,
                           "ledger transfer failed",
                           std::string{to_string(transfer.code)} + ": " +
                               transfer.reason,
                           escrow.id);
}

operation_result_t engine::initialize(const initialize_escrow_t& request) {
  auto lock = std::unique_lock{mutex_};
  if (request.client == request.artisan) {
    return make_error_result(escrow_error_code::validation,
                             kInitializeCodespace,
                             "client and artisan must differ");
  }
  if (request.amount <= 0) {
    return make_error_result(escrow_error_code::validation,
                             kInitializeCodespace, "amount must be positive",
                             to_string(request.amount));
  }
  if (!in_amount_range(request.amount)) {
    return make_error_result(escrow_error_code::validation,
                             kInitializeCodespace, "amount is out of range",
                             to_string(request.amount));
  }

  auto now = clock_();
  auto id = load_next_id();
  auto escrow = escrow_state_t{};
  escrow.id = id;
  escrow.client = request.client;
  escrow.artisan = request.artisan;
  escrow.asset = request.asset;
  escrow.amount = request.amount;
  escrow.deadline = request.deadline;
  escrow.status = escrow_status_t::pending;

  auto events = std::vector<escrow_event_t>{escrow_initialized_t{
      .id = id, .client = request.client, .artisan = request.artisan}};

  auto writes = atelier::storage::write_set{};
  stage_escrow(writes, escrow, now);
  auto counter_key = key::make_next_id_key(encoder_);
  auto counter_view = bytes_view_t{counter_key.data(), counter_key.size()};
  writes.put(encoder_, counter_view, escrow_id_t{id + 1});
  storage_.extend_retention(writes, counter_view, now,
                            options_.renewal_threshold,
                            options_.target_retention);
  stage_events(writes, events);
  storage_.commit(writes);
  lock.unlock();
  publish(events);

  spdlog::info("Escrow {} initialized: amount {} deadline {}", id,
               to_string(request.amount), request.deadline);
  return make_success_result(kInitializeCodespace, id, std::move(events));
}

operation_result_t engine::deposit(const authorization_gate_t& authorized,
                                   const escrow_id_t id,
                                   const asset_id_t& asset) {
  auto lock = std::unique_lock{mutex_};
  auto escrow = load_escrow(id);
  if (!escrow) {
    return make_error_result(escrow_error_code::not_found, kDepositCodespace,
                             "escrow not found", std::to_string(id), id);
  }
  auto now = clock_();
  if (now > escrow->deadline) {
    return make_error_result(escrow_error_code::deadline, kDepositCodespace,
                             "deadline has passed", {}, id);
  }
  if (escrow->status != escrow_status_t::pending) {
    return make_error_result(escrow_error_code::state, kDepositCodespace,
                             "escrow is not pending",
                             describe_status(escrow->status), id);
  }
  if (asset != escrow->asset) {
    return make_error_result(escrow_error_code::validation, kDepositCodespace,
                             "asset does not match escrow", {}, id);
  }

  escrow->status = escrow_status_t::funded;
  auto events = std::vector<escrow_event_t>{
      escrow_funded_t{.id = id,
                      .client = escrow->client,
                      .amount = escrow->amount,
                      .timestamp = now}};
  auto writes = atelier::storage::write_set{};
  stage_escrow(writes, *escrow, now);
  stage_events(writes, events);
  if (auto failed = move_value(kDepositCodespace, authorized, *escrow,
                               escrow->client, options_.custody, writes)) {
    return *failed;
  }
  lock.unlock();
  publish(events);

  spdlog::info("Escrow {} funded with {}", id, to_string(escrow->amount));
  return make_success_result(kDepositCodespace, id, std::move(events));
}

operation_result_t engine::release(const authorization_gate_t& authorized,
                                   const escrow_id_t id,
                                   const asset_id_t& asset) {
  auto lock = std::unique_lock{mutex_};
  auto escrow = load_escrow(id);
  if (!escrow) {
    return make_error_result(escrow_error_code::not_found, kReleaseCodespace,
                             "escrow not found", std::to_string(id), id);
  }
  if (!authorized || !authorized(escrow->client)) {
    return make_error_result(escrow_error_code::authorization,
                             kReleaseCodespace,
                             "client did not authorize release", {}, id);
  }
  auto now = clock_();
  if (now > escrow->deadline) {
    return make_error_result(escrow_error_code::deadline, kReleaseCodespace,
                             "deadline has passed", {}, id);
  }
  if (escrow->status != escrow_status_t::funded) {
    return make_error_result(escrow_error_code::state, kReleaseCodespace,
                             "escrow is not funded",
                             describe_status(escrow->status), id);
  }
  if (asset != escrow->asset) {
    return make_error_result(escrow_error_code::validation, kReleaseCodespace,
                             "asset does not match escrow", {}, id);
  }

  escrow->status = escrow_status_t::released;
  auto events = std::vector<escrow_event_t>{
      escrow_released_t{.id = id,
                        .artisan = escrow->artisan,
                        .amount = escrow->amount,
                        .timestamp = now}};
  auto writes = atelier::storage::write_set{};
  stage_escrow(writes, *escrow, now);
  stage_events(writes, events);
  if (auto failed = move_value(kReleaseCodespace, custody_gate(), *escrow,
                               options_.custody, escrow->artisan, writes)) {
    return *failed;
  }
  lock.unlock();
  publish(events);

  spdlog::info("Escrow {} released {} to artisan {}", id,
               to_string(escrow->amount), to_hex(escrow->artisan));
  return make_success_result(kReleaseCodespace, id, std::move(events));
}

operation_result_t engine::reclaim(const authorization_gate_t& authorized,
                                   const escrow_id_t id,
                                   const asset_id_t& asset) {
  auto lock = std::unique_lock{mutex_};
  auto escrow = load_escrow(id);
  if (!escrow) {
    return make_error_result(escrow_error_code::not_found, kReclaimCodespace,
                             "escrow not found", std::to_string(id), id);
  }
  if (!authorized || !authorized(escrow->client)) {
    return make_error_result(escrow_error_code::authorization,
                             kReclaimCodespace,
                             "client did not authorize reclaim", {}, id);
  }
  if (escrow->status != escrow_status_t::funded) {
    return make_error_result(escrow_error_code::state, kReclaimCodespace,
                             "escrow is not funded",
                             describe_status(escrow->status), id);
  }
  auto now = clock_();
  if (now <= escrow->deadline) {
    return make_error_result(escrow_error_code::deadline, kReclaimCodespace,
                             "deadline has not passed", {}, id);
  }
  if (asset != escrow->asset) {
    return make_error_result(escrow_error_code::validation, kReclaimCodespace,
                             "asset does not match escrow", {}, id);
  }

  escrow->status = escrow_status_t::refunded;
  auto events = std::vector<escrow_event_t>{
      escrow_reclaimed_t{.id = id,
                         .client = escrow->client,
                         .amount = escrow->amount,
                         .timestamp = now}};
  auto writes = atelier::storage::write_set{};
  stage_escrow(writes, *escrow, now);
  stage_events(writes, events);
  if (auto failed = move_value(kReclaimCodespace, custody_gate(), *escrow,
                               options_.custody, escrow->client, writes)) {
    return *failed;
  }
  lock.unlock();
  publish(events);

  spdlog::info("Escrow {} refunded {} to client {}", id,
               to_string(escrow->amount), to_hex(escrow->client));
  return make_success_result(kReclaimCodespace, id, std::move(events));
}

escrow_query_result_t engine::get(const escrow_id_t id) const {
  auto result = escrow_query_result_t{};
  result.codespace = std::string{kGetCodespace};
  {
    auto lock = std::scoped_lock{mutex_};
    result.escrow = load_escrow(id);
  }
  if (!result.escrow) {
    result.code = escrow_error_code::not_found;
    result.log = "escrow " + std::to_string(id) + " not found";
    return result;
  }
  result.log = "ok";
  return result;
}

escrow_id_t engine::next_id() const {
  auto lock = std::scoped_lock{mutex_};
  return load_next_id();
}

operation_result_t engine::execute(const transaction_t& tx) {
  if (tx.version != 1) {
    return make_error_result(escrow_error_code::validation, kExecuteCodespace,
                             "unsupported transaction version",
                             std::to_string(tx.version));
  }

  auto verified = true;
  if (options_.require_strict_crypto) {
    auto verifier = signature_verifier_t{};
    {
      auto lock = std::scoped_lock{mutex_};
      verifier = signature_verifier_;
    }
    auto hash = make_signing_hash(tx);
    verified = verifier && verifier(bytes_view_t{hash.data(), hash.size()},
                                    tx.signer, tx.signature);
    if (!verified) {
      spdlog::warn("Signature from {} did not verify", to_hex(tx.signer));
    }
  }
  auto authorized = authorization_gate_t{
      [signer = tx.signer, verified](const principal_id_t& principal) {
        return verified && principal == signer;
      }};

  return std::visit(
      overloaded{
          [&](const initialize_escrow_t& request) {
            return initialize(request);
          },
          [&](const deposit_escrow_t& call) {
            return deposit(authorized, call.id, call.asset);
          },
          [&](const release_escrow_t& call) {
            return release(authorized, call.id, call.asset);
          },
          [&](const reclaim_escrow_t& call) {
            return reclaim(authorized, call.id, call.asset);
          }},
      tx.payload);
}

operation_result_t engine::execute(const bytes_view_t& raw_tx) {
  if (raw_tx.empty()) {
    return make_error_result(escrow_error_code::validation, kExecuteCodespace,
                             "empty transaction");
  }
  auto tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    return make_error_result(escrow_error_code::validation, kExecuteCodespace,
                             "invalid transaction encoding");
  }
  return execute(*tx);
}

std::vector<event_record_t> engine::events(const uint64_t from_sequence,
                                           const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<event_record_t>{};
  auto last = load_next_event_sequence() - 1;
  auto first = std::max<uint64_t>(from_sequence, 1);
  auto end = std::min(to_sequence, last);
  for (auto sequence = first; sequence <= end; ++sequence) {
    auto key = key::make_event_key(encoder_, sequence);
    auto record = storage_.get<event_record_t>(
        encoder_, bytes_view_t{key.data(), key.size()});
    if (!record) {
      atelier::common::critical("event log has no entry {}", sequence);
    }
    records.push_back(std::move(*record));
  }
  return records;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!options_.require_strict_crypto) {
    spdlog::warn("Ignoring signature verifier; strict crypto is disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
  spdlog::info("Installed custom signature verifier");
}

}  // namespace atelier::execution
