/*
 * 설명: /proc 기반 세션 프로세스 확인과 고정 간격 재시도를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/session_oracle_test.cpp
 */
#include "extauth/session_oracle.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace extauth {

namespace {
std::optional<uid_t> UidForUser(const std::string& user) {
  long buf_size = sysconf(_SC_GETPW_R_SIZE_MAX);
  std::vector<char> buffer(buf_size > 0 ? static_cast<std::size_t>(buf_size) : 16384);
  struct passwd pwd;
  struct passwd* result = nullptr;
  if (getpwnam_r(user.c_str(), &pwd, buffer.data(), buffer.size(), &result) != 0 || result == nullptr) {
    return std::nullopt;
  }
  return result->pw_uid;
}

bool IsPidName(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  for (char c : name) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}
}  // namespace

std::vector<std::string> SplitCmdline(const std::string& raw) {
  std::vector<std::string> args;
  std::size_t pos = 0;
  while (pos < raw.size()) {
    auto end = raw.find('\0', pos);
    if (end == std::string::npos) {
      end = raw.size();
    }
    args.push_back(raw.substr(pos, end - pos));
    pos = end + 1;
  }
  return args;
}

bool IsAgentProcess(const std::vector<std::string>& argv, const std::string& agent_path,
                    const std::string& session_id) {
  if (argv.empty() || argv[0] != agent_path) {
    return false;
  }
  for (std::size_t i = 1; i + 1 < argv.size(); ++i) {
    if (argv[i] == "--session-id") {
      return argv[i + 1] == session_id;
    }
  }
  return false;
}

ProcessTableOracle::ProcessTableOracle(std::string agent_path, std::string proc_root)
    : agent_path_(std::move(agent_path)), proc_root_(std::move(proc_root)) {}

bool ProcessTableOracle::SessionExists(const std::string& user, const std::string& session_id) {
  auto uid = UidForUser(user);
  if (!uid) {
    return false;
  }

  std::error_code ec;
  std::filesystem::directory_iterator it(proc_root_, ec);
  if (ec) {
    throw std::runtime_error("프로세스 목록을 읽을 수 없습니다: " + ec.message());
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw std::runtime_error("프로세스 목록 순회 실패: " + ec.message());
    }
    auto name = it->path().filename().string();
    if (!IsPidName(name)) {
      continue;
    }
    // 스캔 도중 사라진 프로세스는 건너뛴다.
    struct stat st;
    if (::stat(it->path().c_str(), &st) != 0 || st.st_uid != *uid) {
      continue;
    }
    std::ifstream cmdline(it->path() / "cmdline", std::ios::binary);
    if (!cmdline) {
      continue;
    }
    std::string raw((std::istreambuf_iterator<char>(cmdline)), std::istreambuf_iterator<char>());
    if (IsAgentProcess(SplitCmdline(raw), agent_path_, session_id)) {
      return true;
    }
  }
  return false;
}

SessionVerifier::SessionVerifier(std::shared_ptr<SessionOracle> oracle, RetryPolicy policy, Sleeper sleeper)
    : oracle_(std::move(oracle)), policy_(policy), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
  if (policy_.attempts == 0) {
    policy_.attempts = 1;
  }
}

bool SessionVerifier::Verify(const std::string& user, const std::string& session_id, std::string* fault) {
  std::size_t failed_lookups = 0;
  std::string last_error;
  for (std::size_t attempt = 1; attempt <= policy_.attempts; ++attempt) {
    try {
      if (oracle_->SessionExists(user, session_id)) {
        return true;
      }
    } catch (const std::exception& ex) {
      ++failed_lookups;
      last_error = ex.what();
    }
    if (attempt < policy_.attempts) {
      sleeper_(policy_.delay);
    }
  }
  if (fault && failed_lookups > 0) {
    *fault = "세션 조회 실패 " + std::to_string(failed_lookups) + "/" + std::to_string(policy_.attempts) +
             "회: " + last_error;
  }
  return false;
}

}  // namespace extauth
