/*
 * 설명: 토큰 발급/검증 단계의 실패 종류와 결과 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace extauth {

enum class GatewayError {
  kNone,
  kMalformedRequest,
  kInvalidSession,
  kInvalidToken,
  kTokenExpired,
  kProofMissing,
  kProofOwnerMismatch,
  kProofExpired,
  kValidationFailed,
};

std::string_view ToString(GatewayError error);

// 성공 시 value, 실패 시 error/message 중 하나만 채워진다.
template <typename T>
struct Outcome {
  std::optional<T> value;
  GatewayError error{GatewayError::kNone};
  std::string message;

  static Outcome Ok(T v) {
    Outcome out;
    out.value = std::move(v);
    return out;
  }

  static Outcome Fail(GatewayError e, std::string msg) {
    Outcome out;
    out.error = e;
    out.message = std::move(msg);
    return out;
  }

  bool ok() const { return value.has_value(); }
};

}  // namespace extauth
