#pragma once
#include <atelier/schema/escrow_call.hpp>
#include <atelier/schema/initialize_escrow.hpp>
#include <atelier/schema/primitives.hpp>
#include <variant>

namespace atelier::schema {

using transaction_payload_t = std::variant<initialize_escrow_t,
                                           deposit_escrow_t,
                                           release_escrow_t,
                                           reclaim_escrow_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  principal_id_t signer{};
  transaction_payload_t payload{};
  ed25519_signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace atelier::schema
