#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "core/model/types.hpp"

namespace totem {

// Authenticates free boost requests signed by the frontend signer and keeps
// the consumed set. Entries older than the tolerance window can be purged
// because any replay of them already fails the expiry check.
class SignatureVerifier {
public:
  void set_frontend_signer(std::string public_key_hex) { frontend_signer_ = std::move(public_key_hex); }
  void set_tolerance_seconds(std::int64_t seconds) { tolerance_seconds_ = seconds; }

  [[nodiscard]] const std::string& frontend_signer() const { return frontend_signer_; }
  [[nodiscard]] std::int64_t tolerance_seconds() const { return tolerance_seconds_; }

  // Runs every check without consuming. On success out_digest holds the key
  // that consume() must be called with once the boost commits.
  Result check(const BoostDraft& draft, std::int64_t now_unix, std::string& out_digest) const;
  void consume(std::string digest, std::int64_t timestamp);
  Result verify(const BoostDraft& draft, std::int64_t now_unix);

  std::size_t purge_expired(std::int64_t now_unix);

  [[nodiscard]] bool consumed(std::string_view digest) const;
  [[nodiscard]] std::size_t consumed_count() const { return consumed_.size(); }
  [[nodiscard]] const std::unordered_map<std::string, std::int64_t>& consumed_entries() const {
    return consumed_;
  }
  void restore(std::unordered_map<std::string, std::int64_t> entries) { consumed_ = std::move(entries); }

private:
  std::string frontend_signer_;
  std::int64_t tolerance_seconds_ = 5 * 60;
  std::unordered_map<std::string, std::int64_t> consumed_;
};

}  // namespace totem
