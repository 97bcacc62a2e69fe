/*
 * 설명: 실패 종류를 로그용 코드 문자열로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 */
#include "extauth/error.hpp"

namespace extauth {

std::string_view ToString(GatewayError error) {
  switch (error) {
    case GatewayError::kNone:
      return "none";
    case GatewayError::kMalformedRequest:
      return "malformed_request";
    case GatewayError::kInvalidSession:
      return "invalid_session";
    case GatewayError::kInvalidToken:
      return "invalid_token";
    case GatewayError::kTokenExpired:
      return "token_expired";
    case GatewayError::kProofMissing:
      return "proof_missing";
    case GatewayError::kProofOwnerMismatch:
      return "proof_owner_mismatch";
    case GatewayError::kProofExpired:
      return "proof_expired";
    case GatewayError::kValidationFailed:
      return "validation_failed";
  }
  return "unknown";
}

}  // namespace extauth
