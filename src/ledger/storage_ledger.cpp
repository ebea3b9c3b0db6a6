#include <spdlog/spdlog.h>
#include <atelier/ledger/storage_ledger.hpp>
#include <atelier/schema/key/engine_keys.hpp>

using namespace atelier::schema;

namespace {

transfer_result_t make_transfer_error(const transfer_error_code code,
                                      std::string reason) {
  return transfer_result_t{.code = code, .reason = std::move(reason)};
}

bool credit_overflows(const amount_t& balance, const amount_t& amount) {
  return balance > kMaxAmount - amount;
}

}  // namespace

namespace atelier::ledger {

storage_ledger::storage_ledger(
    atelier::schema::encoding::encoder<
        atelier::schema::encoding::scale_encoder_tag>& encoder,
    atelier::storage::storage<atelier::storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder}, storage_{storage} {}

amount_t storage_ledger::load_balance(const asset_id_t& asset,
                                      const principal_id_t& principal) const {
  auto key = key::make_balance_key(encoder_, asset, principal);
  auto stored = storage_.get<amount_bytes_t>(
      encoder_, bytes_view_t{key.data(), key.size()});
  if (!stored) {
    return amount_t{0};
  }
  return from_amount_bytes(*stored);
}

amount_t storage_ledger::balance(const asset_id_t& asset,
                                 const principal_id_t& principal) const {
  auto lock = std::scoped_lock{mutex_};
  return load_balance(asset, principal);
}

transfer_result_t storage_ledger::transfer(
    const atelier::execution::authorization_gate_t& authorized,
    const asset_id_t& asset,
    const principal_id_t& from,
    const principal_id_t& to,
    const amount_t& amount,
    const atelier::storage::write_set& writes) {
  if (amount <= 0 || !in_amount_range(amount)) {
    return make_transfer_error(transfer_error_code::invalid_amount,
                               "transfer amount out of range");
  }
  if (!authorized || !authorized(from)) {
    return make_transfer_error(transfer_error_code::unauthorized,
                               "source principal did not authorize transfer");
  }

  auto lock = std::scoped_lock{mutex_};
  auto from_balance = load_balance(asset, from);
  if (from_balance < amount) {
    return make_transfer_error(
        transfer_error_code::insufficient_balance,
        "balance " + to_string(from_balance) + " below " + to_string(amount));
  }
  auto batch = writes;
  if (from != to) {
    auto to_balance = load_balance(asset, to);
    if (credit_overflows(to_balance, amount)) {
      return make_transfer_error(transfer_error_code::invalid_amount,
                                 "credit would overflow destination balance");
    }
    auto from_key = key::make_balance_key(encoder_, asset, from);
    auto to_key = key::make_balance_key(encoder_, asset, to);
    batch.put(encoder_, bytes_view_t{from_key.data(), from_key.size()},
              to_amount_bytes(from_balance - amount));
    batch.put(encoder_, bytes_view_t{to_key.data(), to_key.size()},
              to_amount_bytes(to_balance + amount));
  }
  storage_.commit(batch);
  spdlog::debug("Moved {} of asset {} from {} to {}", to_string(amount),
                to_hex(asset), to_hex(from), to_hex(to));
  return transfer_result_t{};
}

transfer_result_t storage_ledger::transfer(
    const atelier::execution::authorization_gate_t& authorized,
    const asset_id_t& asset,
    const principal_id_t& from,
    const principal_id_t& to,
    const amount_t& amount) {
  return transfer(authorized, asset, from, to, amount,
                  atelier::storage::write_set{});
}

transfer_result_t storage_ledger::mint(const asset_id_t& asset,
                                       const principal_id_t& to,
                                       const amount_t& amount) {
  if (amount <= 0 || !in_amount_range(amount)) {
    return make_transfer_error(transfer_error_code::invalid_amount,
                               "mint amount out of range");
  }
  auto lock = std::scoped_lock{mutex_};
  auto to_balance = load_balance(asset, to);
  if (credit_overflows(to_balance, amount)) {
    return make_transfer_error(transfer_error_code::invalid_amount,
                               "mint would overflow destination balance");
  }
  auto writes = atelier::storage::write_set{};
  auto to_key = key::make_balance_key(encoder_, asset, to);
  writes.put(encoder_, bytes_view_t{to_key.data(), to_key.size()},
             to_amount_bytes(to_balance + amount));
  storage_.commit(writes);
  spdlog::info("Minted {} of asset {} to {}", to_string(amount), to_hex(asset),
               to_hex(to));
  return transfer_result_t{};
}

}  // namespace atelier::ledger
