#include "core/auth/signature_verifier.hpp"

#include "core/crypto/crypto.hpp"

namespace totem {

Result SignatureVerifier::check(const BoostDraft& draft, std::int64_t now_unix,
                                std::string& out_digest) const {
  if (frontend_signer_.empty()) {
    return Result::failure(BoostError::InvalidSignature, "No frontend signer is configured.");
  }

  const std::string digest = boost_request_digest(draft.user, draft.totem, draft.timestamp);
  if (!verify_detached(digest, draft.signature, frontend_signer_)) {
    return Result::failure(BoostError::InvalidSignature,
                           "Boost signature was not produced by the frontend signer.");
  }

  const std::int64_t drift = now_unix >= draft.timestamp ? now_unix - draft.timestamp
                                                        : draft.timestamp - now_unix;
  if (drift > tolerance_seconds_) {
    return Result::failure(BoostError::SignatureExpired,
                           "Boost signature timestamp is outside the accepted window.");
  }

  if (consumed_.contains(digest)) {
    return Result::failure(BoostError::SignatureAlreadyUsed, "Boost signature was already used.");
  }

  out_digest = digest;
  return Result::success("Boost signature accepted.", digest);
}

void SignatureVerifier::consume(std::string digest, std::int64_t timestamp) {
  consumed_.emplace(std::move(digest), timestamp);
}

Result SignatureVerifier::verify(const BoostDraft& draft, std::int64_t now_unix) {
  std::string digest;
  Result checked = check(draft, now_unix, digest);
  if (!checked.ok) {
    return checked;
  }
  consume(std::move(digest), draft.timestamp);
  return checked;
}

std::size_t SignatureVerifier::purge_expired(std::int64_t now_unix) {
  return std::erase_if(consumed_, [&](const auto& entry) {
    return entry.second < now_unix - tolerance_seconds_;
  });
}

bool SignatureVerifier::consumed(std::string_view digest) const {
  return consumed_.contains(std::string{digest});
}

}  // namespace totem
