/*
 * 설명: 사용자명, 세션 ID, 토큰 형식 검사를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/validation_test.cpp
 */
#pragma once

#include <string>

namespace extauth {

// POSIX 계정명: [a-z_] 로 시작, 이후 [a-z0-9_-] 최대 31자 (마지막 '$' 허용)
bool IsValidUser(const std::string& user);

// [a-zA-Z0-9_-] 0..128자
bool IsValidSessionId(const std::string& session_id);

// 토큰 알파벳으로만 된 정확히 kTokenLength 자
bool IsValidToken(const std::string& token);

// 소문자 16진수 SHA-512 다이제스트 (128자)
bool IsValidProofName(const std::string& name);

}  // namespace extauth
