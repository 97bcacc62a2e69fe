/*
 * 설명: 원격 데스크톱 세션 프로세스 존재 여부 확인과 재시도 검증기를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/session_oracle_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace extauth {

class SessionOracle {
 public:
  virtual ~SessionOracle() = default;

  // 프로세스 목록 자체를 읽을 수 없으면 예외를 던진다.
  virtual bool SessionExists(const std::string& user, const std::string& session_id) = 0;
};

// /proc 를 훑어 agent 바이너리 + 소유자 + --session-id 인자가 모두 맞는 프로세스를 찾는다.
class ProcessTableOracle : public SessionOracle {
 public:
  explicit ProcessTableOracle(std::string agent_path, std::string proc_root = "/proc");

  bool SessionExists(const std::string& user, const std::string& session_id) override;

 private:
  std::string agent_path_;
  std::string proc_root_;
};

bool IsAgentProcess(const std::vector<std::string>& argv, const std::string& agent_path,
                    const std::string& session_id);

std::vector<std::string> SplitCmdline(const std::string& raw);

struct RetryPolicy {
  std::size_t attempts{5};
  std::chrono::milliseconds delay{std::chrono::milliseconds(1000)};
};

class SessionVerifier {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  SessionVerifier(std::shared_ptr<SessionOracle> oracle, RetryPolicy policy, Sleeper sleeper = {});

  // 세션이 보일 때까지 policy.attempts 회 확인하고, 시도 사이에 policy.delay 만큼 쉰다.
  // 오라클 예외는 실패한 시도로 센다. fault 가 주어지면 마지막 예외와 횟수를 한 줄로 남긴다.
  bool Verify(const std::string& user, const std::string& session_id, std::string* fault = nullptr);

 private:
  std::shared_ptr<SessionOracle> oracle_;
  RetryPolicy policy_;
  Sleeper sleeper_;
};

}  // namespace extauth
