/*
 * 설명: 요청 파라미터 형식 검사를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/validation_test.cpp
 */
#include "extauth/validation.hpp"

#include "extauth/token_generator.hpp"

namespace extauth {

namespace {
bool IsLowerAlnum(char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'); }

bool IsTokenChar(char c) { return kTokenAlphabet.find(c) != std::string_view::npos; }
}  // namespace

bool IsValidUser(const std::string& user) {
  if (user.empty() || user.size() > 32) {
    return false;
  }
  if (!(user[0] == '_' || (user[0] >= 'a' && user[0] <= 'z'))) {
    return false;
  }
  std::size_t body_end = user.size();
  if (user.size() > 1 && user.back() == '$') {
    body_end = user.size() - 1;
  }
  for (std::size_t i = 1; i < body_end; ++i) {
    char c = user[i];
    if (!(IsLowerAlnum(c) || c == '_' || c == '-')) {
      return false;
    }
  }
  return true;
}

bool IsValidSessionId(const std::string& session_id) {
  if (session_id.size() > 128) {
    return false;
  }
  for (char c : session_id) {
    if (!IsTokenChar(c)) {
      return false;
    }
  }
  return true;
}

bool IsValidToken(const std::string& token) {
  if (token.size() != kTokenLength) {
    return false;
  }
  for (char c : token) {
    if (!IsTokenChar(c)) {
      return false;
    }
  }
  return true;
}

bool IsValidProofName(const std::string& name) {
  if (name.size() != 128) {
    return false;
  }
  for (char c : name) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

}  // namespace extauth
