/*
 * 설명: 요청마다 전용 스레드를 띄우고 종료 시 모두 합류시키는 작업자 집합을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/request_workers_test.cpp, server/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace extauth {

// 세션 확인은 재시도 대기로 수 초 걸리므로 요청 하나가 스레드 하나를 쓴다.
// 고정 크기 풀과 달리 느린 요청이 다른 요청을 기다리게 하지 않는다.
class RequestWorkers {
 public:
  RequestWorkers() = default;
  ~RequestWorkers();

  RequestWorkers(const RequestWorkers&) = delete;
  RequestWorkers& operator=(const RequestWorkers&) = delete;

  // Stop 이후에는 false 를 돌려주고 task 를 실행하지 않는다.
  bool Spawn(std::function<void()> task);
  // 새 요청을 받지 않는다. 실행 중인 작업은 계속된다.
  void Stop();
  // 실행 중인 작업이 모두 끝날 때까지 기다린다.
  void Join();

  std::size_t Active() const;

 private:
  void Finish(std::thread::id id);
  std::vector<std::thread> TakeFinishedLocked();

  mutable std::mutex mutex_;
  std::condition_variable idle_;
  std::unordered_map<std::thread::id, std::thread> running_;
  std::vector<std::thread> finished_;
  bool stopped_{false};
};

}  // namespace extauth
