/*
 * 설명: 인증 디렉터리의 접근 파일로 사용자 계정 소유를 확인한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/access_proof_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "extauth/error.hpp"
#include "extauth/request_log.hpp"

namespace extauth {

class AccessProofVerifier {
 public:
  AccessProofVerifier(std::string authorization_dir, std::shared_ptr<RequestLogger> logger);

  // 존재 -> 소유자 -> 수정 시각 순서로 확인하고 통과하면 파일을 지운다.
  // 실패 시 kProofMissing / kProofOwnerMismatch / kProofExpired 중 하나.
  GatewayError Verify(const std::string& user, const std::string& proof_name, std::chrono::seconds max_age,
                      std::chrono::system_clock::time_point now, const LogContext& ctx);

  const std::string& Directory() const { return authorization_dir_; }

 private:
  std::string authorization_dir_;
  std::shared_ptr<RequestLogger> logger_;
};

// 디렉터리 안의 항목을 모두 지운다. 디렉터리가 없으면 만든다.
// 일부 항목을 지우지 못하면 false 와 마지막 오류 메시지를 돌려준다.
bool ResetAuthorizationDir(const std::string& authorization_dir, std::string& error_message);

std::string UserNameForUid(unsigned int uid);

}  // namespace extauth
