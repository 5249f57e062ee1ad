#pragma once

#include <string>
#include <string_view>

namespace runeforge::etch {

enum class EtchErrorCode {
  kNone,
  // Input validation and codec failures; raised before any external call.
  kInvalidEtching,
  kInvalidNameCharacter,
  kMalformedVarInt,
  kTruncatedPayload,
  kMalformedPayload,
  kInvalidArgument,
  kInvalidState,
  // Not a failure: the commit address has no confirmed output yet.
  kPendingFunding,
  kSignerUnavailable,
  kSignerMismatch,
  kInsufficientFunds,
  kPolicyViolation,
  kBroadcastRejected,
  kProviderUnavailable,
  kTimeout,
  kRevealInFlight,
};

struct EtchError {
  EtchErrorCode code{EtchErrorCode::kNone};
  std::string message;
  // Set when repeating the same call may succeed (timeouts, unreachable
  // collaborators).
  bool transient{false};
};

inline std::string_view EtchErrorCodeName(EtchErrorCode code) {
  switch (code) {
    case EtchErrorCode::kNone:
      return "none";
    case EtchErrorCode::kInvalidEtching:
      return "invalid-etching";
    case EtchErrorCode::kInvalidNameCharacter:
      return "invalid-name-character";
    case EtchErrorCode::kMalformedVarInt:
      return "malformed-varint";
    case EtchErrorCode::kTruncatedPayload:
      return "truncated-payload";
    case EtchErrorCode::kMalformedPayload:
      return "malformed-payload";
    case EtchErrorCode::kInvalidArgument:
      return "invalid-argument";
    case EtchErrorCode::kInvalidState:
      return "invalid-state";
    case EtchErrorCode::kPendingFunding:
      return "pending-funding";
    case EtchErrorCode::kSignerUnavailable:
      return "signer-unavailable";
    case EtchErrorCode::kSignerMismatch:
      return "signer-mismatch";
    case EtchErrorCode::kInsufficientFunds:
      return "insufficient-funds";
    case EtchErrorCode::kPolicyViolation:
      return "policy-violation";
    case EtchErrorCode::kBroadcastRejected:
      return "broadcast-rejected";
    case EtchErrorCode::kProviderUnavailable:
      return "provider-unavailable";
    case EtchErrorCode::kTimeout:
      return "timeout";
    case EtchErrorCode::kRevealInFlight:
      return "reveal-in-flight";
  }
  return "unknown";
}

}  // namespace runeforge::etch
