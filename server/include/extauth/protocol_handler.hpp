/*
 * 설명: 요청 토큰 -> 세션 토큰 -> 세션 검증 3단계 핸드셰이크를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "extauth/access_proof.hpp"
#include "extauth/api_response.hpp"
#include "extauth/error.hpp"
#include "extauth/request_log.hpp"
#include "extauth/request_params.hpp"
#include "extauth/session_oracle.hpp"
#include "extauth/token_store.hpp"

namespace extauth {

struct RequestTokenGrant {
  std::string request_token;
  std::string access_file;
};

struct SessionTokenGrant {
  std::string session_token;
};

struct HandlerConfig {
  std::chrono::seconds request_token_ttl{std::chrono::seconds(10)};
  std::chrono::seconds session_token_ttl{std::chrono::seconds(30)};
};

class ProtocolHandler {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  ProtocolHandler(const HandlerConfig& config, std::shared_ptr<RequestTokenStore> request_tokens,
                  std::shared_ptr<SessionTokenStore> session_tokens,
                  std::shared_ptr<SessionVerifier> session_verifier,
                  std::shared_ptr<AccessProofVerifier> proof_verifier, std::shared_ptr<RequestLogger> logger,
                  Clock clock = {});

  Outcome<RequestTokenGrant> IssueRequestToken(const std::string& user, const std::string& session_id,
                                               const LogContext& ctx);
  Outcome<SessionTokenGrant> IssueSessionToken(const std::string& request_token, const LogContext& ctx);
  // 성공 시 토큰 소유 사용자명을 돌려준다. 토큰은 결과와 관계없이 소모된다.
  Outcome<std::string> ValidateSessionToken(const std::string& session_id, const std::string& session_token,
                                            const LogContext& ctx);

  // GET ?action=... (사용자용 토큰 발급)
  GatewayResponse HandleGet(const Params& params, const LogContext& ctx);
  // POST authenticationToken=...&sessionId=... (세션 프로세스용 검증)
  GatewayResponse HandlePost(const Params& form, const LogContext& ctx);

 private:
  template <typename T>
  Outcome<T> Reject(GatewayError error, std::string message, const LogContext& ctx, const std::string& detail = {});

  HandlerConfig config_;
  std::shared_ptr<RequestTokenStore> request_tokens_;
  std::shared_ptr<SessionTokenStore> session_tokens_;
  std::shared_ptr<SessionVerifier> session_verifier_;
  std::shared_ptr<AccessProofVerifier> proof_verifier_;
  std::shared_ptr<RequestLogger> logger_;
  Clock clock_;
};

}  // namespace extauth
