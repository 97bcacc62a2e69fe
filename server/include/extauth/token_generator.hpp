/*
 * 설명: CSPRNG 기반 토큰 생성과 솔트가 섞인 접근 파일 이름 파생을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/token_generator_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace extauth {

constexpr std::size_t kTokenLength = 256;
constexpr std::string_view kTokenAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-";

// RAND_bytes 실패 시 std::runtime_error 를 던진다.
std::string GenerateToken(std::size_t length = kTokenLength);

// SHA-512(token || salt) 의 16진수 문자열. salt 는 호출마다 새로 만들고 저장하지 않는다.
std::string DeriveProofName(const std::string& token);

}  // namespace extauth
