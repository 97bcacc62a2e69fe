/*
 * 설명: 3단계 토큰 핸드셰이크와 파라미터 검증, 오류 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/e2e/gateway_flow_test.cpp
 */
#include "extauth/protocol_handler.hpp"

#include <initializer_list>

#include <nlohmann/json.hpp>

#include "extauth/token_generator.hpp"
#include "extauth/validation.hpp"

namespace extauth {

namespace {
const char kActionRequestToken[] = "requestToken";
const char kActionSessionToken[] = "sessionToken";

std::string ProofFailureMessage(GatewayError error) {
  switch (error) {
    case GatewayError::kProofOwnerMismatch:
      return "The user is not the one that created the access file";
    case GatewayError::kProofExpired:
      return "The access file has expired";
    default:
      return "The access file does not exist";
  }
}

bool HasKeys(const Params& params, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (params.find(key) == params.end()) {
      return false;
    }
  }
  return true;
}
}  // namespace

ProtocolHandler::ProtocolHandler(const HandlerConfig& config, std::shared_ptr<RequestTokenStore> request_tokens,
                                 std::shared_ptr<SessionTokenStore> session_tokens,
                                 std::shared_ptr<SessionVerifier> session_verifier,
                                 std::shared_ptr<AccessProofVerifier> proof_verifier,
                                 std::shared_ptr<RequestLogger> logger, Clock clock)
    : config_(config), request_tokens_(std::move(request_tokens)), session_tokens_(std::move(session_tokens)),
      session_verifier_(std::move(session_verifier)), proof_verifier_(std::move(proof_verifier)),
      logger_(std::move(logger)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

template <typename T>
Outcome<T> ProtocolHandler::Reject(GatewayError error, std::string message, const LogContext& ctx,
                                   const std::string& detail) {
  if (logger_) {
    std::string line = std::string(ToString(error)) + ": " + message;
    if (!detail.empty()) {
      line += " (" + detail + ")";
    }
    logger_->Error(ctx, line);
  }
  return Outcome<T>::Fail(error, std::move(message));
}

Outcome<RequestTokenGrant> ProtocolHandler::IssueRequestToken(const std::string& user, const std::string& session_id,
                                                              const LogContext& ctx) {
  if (!IsValidUser(user)) {
    return Reject<RequestTokenGrant>(GatewayError::kMalformedRequest, "The authUser parameter is not valid", ctx);
  }
  if (!IsValidSessionId(session_id)) {
    return Reject<RequestTokenGrant>(GatewayError::kMalformedRequest, "The sessionId parameter is not valid", ctx);
  }
  std::string fault;
  if (!session_verifier_->Verify(user, session_id, &fault)) {
    return Reject<RequestTokenGrant>(GatewayError::kInvalidSession,
                                     "The given session for the user does not exist", ctx, fault);
  }

  RequestTokenGrant grant;
  grant.request_token = GenerateToken();
  grant.access_file = DeriveProofName(grant.request_token);
  request_tokens_->Add(grant.request_token, RequestTokenRecord{user, session_id, clock_(), grant.access_file});
  return Outcome<RequestTokenGrant>::Ok(std::move(grant));
}

Outcome<SessionTokenGrant> ProtocolHandler::IssueSessionToken(const std::string& request_token,
                                                              const LogContext& ctx) {
  if (!IsValidToken(request_token)) {
    return Reject<SessionTokenGrant>(GatewayError::kMalformedRequest, "The requestToken parameter is not valid",
                                     ctx);
  }
  auto record = request_tokens_->Take(request_token);
  if (!record) {
    return Reject<SessionTokenGrant>(GatewayError::kInvalidToken, "The requestToken parameter is not valid", ctx);
  }
  auto now = clock_();
  if (now - record->created_at > config_.request_token_ttl) {
    return Reject<SessionTokenGrant>(GatewayError::kTokenExpired, "The requestToken is not valid anymore", ctx);
  }

  auto proof = proof_verifier_->Verify(record->user, record->proof_name, config_.request_token_ttl, now, ctx);
  if (proof != GatewayError::kNone) {
    return Reject<SessionTokenGrant>(proof, ProofFailureMessage(proof), ctx);
  }

  // 두 단계 사이에 세션이 끝났을 수 있다.
  std::string fault;
  if (!session_verifier_->Verify(record->user, record->session_id, &fault)) {
    return Reject<SessionTokenGrant>(GatewayError::kInvalidSession,
                                     "The given session for the user does not exist", ctx, fault);
  }

  SessionTokenGrant grant;
  grant.session_token = GenerateToken();
  session_tokens_->Add(grant.session_token, SessionTokenRecord{record->user, record->session_id, clock_()});
  return Outcome<SessionTokenGrant>::Ok(std::move(grant));
}

Outcome<std::string> ProtocolHandler::ValidateSessionToken(const std::string& session_id,
                                                           const std::string& session_token, const LogContext& ctx) {
  if (!IsValidSessionId(session_id)) {
    return Reject<std::string>(GatewayError::kMalformedRequest, "The sessionId parameter is not valid", ctx);
  }
  if (!IsValidToken(session_token)) {
    return Reject<std::string>(GatewayError::kMalformedRequest, "The sessionToken parameter is not valid", ctx);
  }
  auto record = session_tokens_->Take(session_token);
  if (!record || record->session_id != session_id || clock_() - record->created_at > config_.session_token_ttl) {
    return Reject<std::string>(GatewayError::kValidationFailed, "The session token is not valid", ctx);
  }
  return Outcome<std::string>::Ok(record->user);
}

GatewayResponse ProtocolHandler::HandleGet(const Params& params, const LogContext& ctx) {
  if (params.empty() || params.size() > 3) {
    auto out = Reject<RequestTokenGrant>(GatewayError::kMalformedRequest,
                                         "Incorrect number of parameters passed.", ctx);
    return MakeErrorText(out.message);
  }
  auto action_it = params.find("action");
  if (action_it == params.end()) {
    auto out = Reject<RequestTokenGrant>(GatewayError::kMalformedRequest,
                                         "Incorrect parameters for the request\nThey should be action", ctx);
    return MakeErrorText(out.message);
  }

  if (action_it->second == kActionRequestToken) {
    if (!HasKeys(params, {"authUser", "sessionID"})) {
      auto out = Reject<RequestTokenGrant>(
          GatewayError::kMalformedRequest,
          "Incorrect parameters for the request token\nThey should be authUser, sessionID", ctx);
      return MakeErrorText(out.message);
    }
    auto out = IssueRequestToken(params.at("authUser"), params.at("sessionID"), ctx);
    if (!out.ok()) {
      return MakeErrorText(out.message);
    }
    return MakeJsonResponse({{"requestToken", out.value->request_token}, {"accessFile", out.value->access_file}});
  }

  if (action_it->second == kActionSessionToken) {
    if (!HasKeys(params, {"requestToken"})) {
      auto out = Reject<SessionTokenGrant>(GatewayError::kMalformedRequest,
                                           "Incorrect parameters for the session token\nThey should be requestToken",
                                           ctx);
      return MakeErrorText(out.message);
    }
    auto out = IssueSessionToken(params.at("requestToken"), ctx);
    if (!out.ok()) {
      return MakeErrorText(out.message);
    }
    return MakeJsonResponse({{"sessionToken", out.value->session_token}});
  }

  auto out = Reject<RequestTokenGrant>(GatewayError::kMalformedRequest, "The action specified is not correct", ctx);
  return MakeErrorText(out.message);
}

GatewayResponse ProtocolHandler::HandlePost(const Params& form, const LogContext& ctx) {
  if (form.size() != 2 || !HasKeys(form, {"authenticationToken", "sessionId"})) {
    auto out = Reject<std::string>(GatewayError::kMalformedRequest,
                                   "Incorrect parameters passed\nThey should be authenticationToken, sessionId", ctx);
    return MakeAuthRejected(out.message);
  }
  auto out = ValidateSessionToken(form.at("sessionId"), form.at("authenticationToken"), ctx);
  if (!out.ok()) {
    return MakeAuthRejected(out.message);
  }
  return MakeAuthAccepted(*out.value);
}

}  // namespace extauth
