#include "core/crypto/crypto.hpp"

#include <array>

#include <sodium.h>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace totem {

std::string boost_request_digest(std::string_view user, std::string_view totem,
                                 std::int64_t timestamp) {
  const std::string payload = util::canonical_join({
      {"domain", std::string{kSignatureDomain}},
      {"user", std::string{user}},
      {"totem", std::string{totem}},
      {"timestamp", std::to_string(timestamp)},
  });
  return util::sha256_hex(payload);
}

bool is_valid_public_key(std::string_view public_key_hex) {
  return util::from_hex(public_key_hex).size() == crypto_sign_PUBLICKEYBYTES;
}

bool verify_detached(std::string_view digest_hex, std::string_view signature_hex,
                     std::string_view public_key_hex) {
  const std::string digest = util::from_hex(digest_hex);
  const std::string sig_bytes = util::from_hex(signature_hex);
  const std::string public_key_bytes = util::from_hex(public_key_hex);

  if (digest.empty() || sig_bytes.size() != crypto_sign_BYTES ||
      public_key_bytes.size() != crypto_sign_PUBLICKEYBYTES) {
    return false;
  }

  return crypto_sign_verify_detached(
             reinterpret_cast<const unsigned char*>(sig_bytes.data()),
             reinterpret_cast<const unsigned char*>(digest.data()),
             static_cast<unsigned long long>(digest.size()),
             reinterpret_cast<const unsigned char*>(public_key_bytes.data())) == 0;
}

Result CryptoEngine::initialize() {
  if (sodium_init() < 0) {
    return Result::failure(BoostError::NotInitialized, "libsodium initialization failed.");
  }
  sodium_ready_ = true;
  return Result::success("Crypto engine initialized.");
}

Result CryptoEngine::generate_identity() {
  if (!sodium_ready_) {
    return Result::failure(BoostError::NotInitialized, "Crypto engine is not initialized.");
  }

  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> public_key{};
  std::array<unsigned char, crypto_sign_SECRETKEYBYTES> private_key{};
  crypto_sign_keypair(public_key.data(), private_key.data());

  identity_.public_key =
      util::to_hex(std::string_view{reinterpret_cast<const char*>(public_key.data()), public_key.size()});
  identity_.private_key =
      util::to_hex(std::string_view{reinterpret_cast<const char*>(private_key.data()), private_key.size()});
  sodium_memzero(private_key.data(), private_key.size());
  ready_ = true;
  return Result::success("Generated signer identity.", identity_.public_key);
}

Result CryptoEngine::adopt_identity(std::string_view private_key_hex) {
  if (!sodium_ready_) {
    return Result::failure(BoostError::NotInitialized, "Crypto engine is not initialized.");
  }

  const std::string private_key = util::from_hex(private_key_hex);
  if (private_key.size() != crypto_sign_SECRETKEYBYTES) {
    return Result::failure(BoostError::InvalidArgument, "Signer private key has the wrong length.");
  }

  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> public_key{};
  crypto_sign_ed25519_sk_to_pk(public_key.data(),
                               reinterpret_cast<const unsigned char*>(private_key.data()));

  identity_.private_key = std::string{private_key_hex};
  identity_.public_key =
      util::to_hex(std::string_view{reinterpret_cast<const char*>(public_key.data()), public_key.size()});
  ready_ = true;
  return Result::success("Adopted signer identity.", identity_.public_key);
}

std::string CryptoEngine::sign(std::string_view digest_hex) const {
  if (!ready_) {
    return {};
  }

  const std::string digest = util::from_hex(digest_hex);
  const std::string private_key = util::from_hex(identity_.private_key);
  if (digest.empty() || private_key.size() != crypto_sign_SECRETKEYBYTES) {
    return {};
  }

  std::array<unsigned char, crypto_sign_BYTES> signature{};
  crypto_sign_detached(signature.data(), nullptr,
                       reinterpret_cast<const unsigned char*>(digest.data()),
                       static_cast<unsigned long long>(digest.size()),
                       reinterpret_cast<const unsigned char*>(private_key.data()));
  return util::to_hex(std::string_view{reinterpret_cast<const char*>(signature.data()), signature.size()});
}

std::string CryptoEngine::sign_boost_request(std::string_view user, std::string_view totem,
                                             std::int64_t timestamp) const {
  return sign(boost_request_digest(user, totem, timestamp));
}

}  // namespace totem
