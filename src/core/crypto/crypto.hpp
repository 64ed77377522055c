#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace totem {

struct SignerKeyPair {
  std::string public_key;
  std::string private_key;
};

// Digest a free boost authorization is signed over: SHA-256 of the
// canonical (domain, user, totem, timestamp) payload, hex encoded.
std::string boost_request_digest(std::string_view user, std::string_view totem,
                                 std::int64_t timestamp);

bool is_valid_public_key(std::string_view public_key_hex);
bool verify_detached(std::string_view digest_hex, std::string_view signature_hex,
                     std::string_view public_key_hex);

class CryptoEngine {
public:
  Result initialize();
  Result generate_identity();
  Result adopt_identity(std::string_view private_key_hex);

  [[nodiscard]] bool ready() const { return ready_; }
  [[nodiscard]] const SignerKeyPair& identity() const { return identity_; }

  [[nodiscard]] std::string sign(std::string_view digest_hex) const;
  [[nodiscard]] std::string sign_boost_request(std::string_view user, std::string_view totem,
                                               std::int64_t timestamp) const;

private:
  SignerKeyPair identity_;
  bool sodium_ready_ = false;
  bool ready_ = false;
};

}  // namespace totem
