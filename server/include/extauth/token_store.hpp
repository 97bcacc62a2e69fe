/*
 * 설명: 용량 제한 FIFO 방식의 1회용 토큰 저장소를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/token_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace extauth {

struct RequestTokenRecord {
  std::string user;
  std::string session_id;
  std::chrono::system_clock::time_point created_at;
  std::string proof_name;
};

struct SessionTokenRecord {
  std::string user;
  std::string session_id;
  std::chrono::system_clock::time_point created_at;
};

// 삽입 순서대로 보관하고 가득 차면 가장 오래된 항목부터 밀어낸다 (조회 여부와 무관).
// Take 는 항목을 꺼내면서 지운다. 만료 판단은 호출자가 created_at 으로 한다.
template <typename Record>
class BoundedTokenStore {
 public:
  explicit BoundedTokenStore(std::size_t capacity) : capacity_(capacity) {}

  BoundedTokenStore(const BoundedTokenStore&) = delete;
  BoundedTokenStore& operator=(const BoundedTokenStore&) = delete;

  void Add(const std::string& token, Record record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
      return;
    }
    auto existing = index_.find(token);
    if (existing != index_.end()) {
      order_.erase(existing->second);
      index_.erase(existing);
    }
    while (order_.size() >= capacity_) {
      index_.erase(order_.front().first);
      order_.pop_front();
    }
    order_.emplace_back(token, std::move(record));
    index_[token] = std::prev(order_.end());
  }

  std::optional<Record> Take(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(token);
    if (it == index_.end()) {
      return std::nullopt;
    }
    Record record = std::move(it->second->second);
    order_.erase(it->second);
    index_.erase(it);
    return record;
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
  }

  std::size_t Capacity() const { return capacity_; }

 private:
  using Entry = std::pair<std::string, Record>;

  const std::size_t capacity_;
  std::list<Entry> order_;
  std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;
  mutable std::mutex mutex_;
};

using RequestTokenStore = BoundedTokenStore<RequestTokenRecord>;
using SessionTokenStore = BoundedTokenStore<SessionTokenRecord>;

}  // namespace extauth
