/*
 * 설명: 접근 파일의 존재/소유자/신선도 확인과 인증 디렉터리 초기화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/access_proof_test.cpp
 */
#include "extauth/access_proof.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include "extauth/validation.hpp"

namespace extauth {

std::string UserNameForUid(unsigned int uid) {
  long buf_size = sysconf(_SC_GETPW_R_SIZE_MAX);
  std::vector<char> buffer(buf_size > 0 ? static_cast<std::size_t>(buf_size) : 16384);
  struct passwd pwd;
  struct passwd* result = nullptr;
  if (getpwuid_r(static_cast<uid_t>(uid), &pwd, buffer.data(), buffer.size(), &result) != 0 || result == nullptr) {
    return {};
  }
  return result->pw_name;
}

AccessProofVerifier::AccessProofVerifier(std::string authorization_dir, std::shared_ptr<RequestLogger> logger)
    : authorization_dir_(std::move(authorization_dir)), logger_(std::move(logger)) {}

GatewayError AccessProofVerifier::Verify(const std::string& user, const std::string& proof_name,
                                         std::chrono::seconds max_age, std::chrono::system_clock::time_point now,
                                         const LogContext& ctx) {
  // 파생 이름 외의 값으로는 디렉터리 밖을 가리킬 수 없게 한다.
  if (!IsValidProofName(proof_name)) {
    return GatewayError::kProofMissing;
  }
  auto path = authorization_dir_ + "/" + proof_name;

  struct stat st;
  if (::lstat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return GatewayError::kProofMissing;
  }
  auto owner = UserNameForUid(st.st_uid);
  if (owner.empty() || owner != user) {
    return GatewayError::kProofOwnerMismatch;
  }
  auto modified = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
  if (now - modified > max_age) {
    return GatewayError::kProofExpired;
  }
  if (::unlink(path.c_str()) != 0 && logger_) {
    logger_->Error(ctx, "접근 파일 삭제 실패 " + path + ": " + std::strerror(errno));
  }
  return GatewayError::kNone;
}

bool ResetAuthorizationDir(const std::string& authorization_dir, std::string& error_message) {
  std::error_code ec;
  std::filesystem::create_directories(authorization_dir, ec);
  if (ec) {
    error_message = authorization_dir + ": " + ec.message();
    return false;
  }
  bool ok = true;
  std::filesystem::directory_iterator it(authorization_dir, ec);
  if (ec) {
    error_message = authorization_dir + ": " + ec.message();
    return false;
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      error_message = authorization_dir + ": " + ec.message();
      return false;
    }
    std::error_code remove_ec;
    std::filesystem::remove_all(it->path(), remove_ec);
    if (remove_ec) {
      ok = false;
      error_message = it->path().string() + ": " + remove_ec.message();
    }
  }
  return ok;
}

}  // namespace extauth
