#include "core/model/errors.hpp"

namespace totem {

ErrorCategory error_category(BoostError error) {
  switch (error) {
    case BoostError::None:
      return ErrorCategory::None;
    case BoostError::InvalidSignature:
    case BoostError::SignatureExpired:
    case BoostError::SignatureAlreadyUsed:
      return ErrorCategory::Auth;
    case BoostError::NotEnoughTokens:
      return ErrorCategory::Eligibility;
    case BoostError::NotEnoughTimePassedForFreeBoost:
      return ErrorCategory::RateLimit;
    case BoostError::InsufficientPayment:
      return ErrorCategory::Payment;
    case BoostError::MilestoneNotAchieved:
      return ErrorCategory::Milestone;
    case BoostError::Paused:
    case BoostError::NotInitialized:
    case BoostError::StorageFailure:
      return ErrorCategory::System;
    case BoostError::Unauthorized:
    case BoostError::InvalidArgument:
      return ErrorCategory::Admin;
    case BoostError::UnknownRequest:
      return ErrorCategory::Callback;
    case BoostError::CollaboratorFailure:
      return ErrorCategory::External;
  }
  return ErrorCategory::System;
}

std::string error_to_string(BoostError error) {
  switch (error) {
    case BoostError::None:
      return "None";
    case BoostError::InvalidSignature:
      return "InvalidSignature";
    case BoostError::SignatureExpired:
      return "SignatureExpired";
    case BoostError::SignatureAlreadyUsed:
      return "SignatureAlreadyUsed";
    case BoostError::NotEnoughTokens:
      return "NotEnoughTokens";
    case BoostError::NotEnoughTimePassedForFreeBoost:
      return "NotEnoughTimePassedForFreeBoost";
    case BoostError::InsufficientPayment:
      return "InsufficientPayment";
    case BoostError::MilestoneNotAchieved:
      return "MilestoneNotAchieved";
    case BoostError::Paused:
      return "Paused";
    case BoostError::Unauthorized:
      return "Unauthorized";
    case BoostError::InvalidArgument:
      return "InvalidArgument";
    case BoostError::UnknownRequest:
      return "UnknownRequest";
    case BoostError::CollaboratorFailure:
      return "CollaboratorFailure";
    case BoostError::NotInitialized:
      return "NotInitialized";
    case BoostError::StorageFailure:
      return "StorageFailure";
  }
  return "Unknown";
}

std::string category_to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::None:
      return "None";
    case ErrorCategory::Auth:
      return "AuthFailure";
    case ErrorCategory::Eligibility:
      return "EligibilityFailure";
    case ErrorCategory::RateLimit:
      return "RateLimitFailure";
    case ErrorCategory::Payment:
      return "PaymentFailure";
    case ErrorCategory::Milestone:
      return "MilestoneFailure";
    case ErrorCategory::System:
      return "SystemFailure";
    case ErrorCategory::Admin:
      return "AdminFailure";
    case ErrorCategory::Callback:
      return "CallbackFailure";
    case ErrorCategory::External:
      return "ExternalFailure";
  }
  return "SystemFailure";
}

}  // namespace totem
