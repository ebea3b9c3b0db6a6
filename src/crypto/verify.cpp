#include <atelier/crypto/verify.hpp>

#include <openssl/evp.h>

#include <memory>

namespace atelier::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

std::optional<keypair_t> export_keypair(EVP_PKEY* pkey) {
  auto keypair = keypair_t{};
  auto secret_size = keypair.secret_key.size();
  if (EVP_PKEY_get_raw_private_key(pkey, keypair.secret_key.data(),
                                   &secret_size) != 1 ||
      secret_size != keypair.secret_key.size()) {
    return std::nullopt;
  }
  auto public_size = keypair.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, keypair.public_key.data(),
                                  &public_size) != 1 ||
      public_size != keypair.public_key.size()) {
    return std::nullopt;
  }
  return keypair;
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

bool verify_signature(const atelier::schema::bytes_view_t& message,
                      const atelier::schema::principal_id_t& signer,
                      const atelier::schema::ed25519_signature_t& signature) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, signer.data(),
                                  signer.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

std::optional<keypair_t> generate_keypair() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) != 1) {
    return std::nullopt;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
  return export_keypair(pkey.get());
}

std::optional<keypair_t> keypair_from_secret(const secret_key_t& secret_key) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   secret_key.data(), secret_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }
  return export_keypair(pkey.get());
}

std::optional<atelier::schema::ed25519_signature_t> sign(
    const atelier::schema::bytes_view_t& message,
    const secret_key_t& secret_key) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   secret_key.data(), secret_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    return std::nullopt;
  }

  auto signature = atelier::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1 ||
      signature_size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace atelier::crypto
