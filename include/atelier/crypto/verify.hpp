#pragma once

#include <atelier/schema/primitives.hpp>
#include <array>
#include <optional>

namespace atelier::crypto {

using secret_key_t = std::array<uint8_t, 32>;

struct keypair_t final {
  secret_key_t secret_key{};
  atelier::schema::principal_id_t public_key{};
};

/// True when the linked OpenSSL provides ed25519.
bool available();

bool verify_signature(const atelier::schema::bytes_view_t& message,
                      const atelier::schema::principal_id_t& signer,
                      const atelier::schema::ed25519_signature_t& signature);

std::optional<keypair_t> generate_keypair();

/// Derive the public half of a raw ed25519 secret key.
std::optional<keypair_t> keypair_from_secret(const secret_key_t& secret_key);

std::optional<atelier::schema::ed25519_signature_t> sign(
    const atelier::schema::bytes_view_t& message,
    const secret_key_t& secret_key);

}  // namespace atelier::crypto
