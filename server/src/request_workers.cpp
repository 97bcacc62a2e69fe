/*
 * 설명: 요청별 작업 스레드 생성과 회수를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/request_workers_test.cpp
 */
#include "extauth/request_workers.hpp"

#include <utility>

namespace extauth {

RequestWorkers::~RequestWorkers() {
  Stop();
  Join();
}

bool RequestWorkers::Spawn(std::function<void()> task) {
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return false;
    }
    finished = TakeFinishedLocked();
    // Finish 는 같은 mutex 를 잡으므로 running_ 등록 전에 끝난 스레드도 안전하다.
    std::thread worker([this, task = std::move(task)]() {
      task();
      Finish(std::this_thread::get_id());
    });
    auto id = worker.get_id();
    running_.emplace(id, std::move(worker));
  }
  for (auto& t : finished) {
    t.join();
  }
  return true;
}

void RequestWorkers::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopped_ = true;
}

void RequestWorkers::Join() {
  std::vector<std::thread> finished;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return running_.empty(); });
    finished = TakeFinishedLocked();
  }
  for (auto& t : finished) {
    t.join();
  }
}

std::size_t RequestWorkers::Active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_.size();
}

void RequestWorkers::Finish(std::thread::id id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = running_.find(id);
  if (it != running_.end()) {
    finished_.push_back(std::move(it->second));
    running_.erase(it);
  }
  if (running_.empty()) {
    idle_.notify_all();
  }
}

std::vector<std::thread> RequestWorkers::TakeFinishedLocked() {
  std::vector<std::thread> out;
  out.swap(finished_);
  return out;
}

}  // namespace extauth
