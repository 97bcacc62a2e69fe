/*
 * 설명: CSPRNG 토큰 생성과 접근 파일 이름 파생을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/token_generator_test.cpp
 */
#include "extauth/token_generator.hpp"

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace extauth {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
}  // namespace

std::string GenerateToken(std::size_t length) {
  static_assert(kTokenAlphabet.size() == 64, "token alphabet must map 6 random bits per character");
  std::vector<unsigned char> buffer(length);
  if (length > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  std::string token;
  token.reserve(length);
  for (unsigned char byte : buffer) {
    token.push_back(kTokenAlphabet[byte & 0x3F]);
  }
  return token;
}

std::string DeriveProofName(const std::string& token) {
  auto salt = GenerateToken(kTokenLength);
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha512(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), token.data(), token.size()) != 1 ||
      EVP_DigestUpdate(ctx.get(), salt.data(), salt.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("SHA-512 digest failed");
  }
  return BytesToHex(digest, digest_len);
}

}  // namespace extauth
