/*
 * 설명: 요청 단위 구조화 로그(JSON 한 줄)를 주입된 출력 스트림에 기록한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace extauth {

struct LogContext {
  std::string trace_id;
  std::string method;
  std::string client_address;
  std::string message;
  std::optional<long> latency_ms;
};

class RequestLogger {
 public:
  explicit RequestLogger(std::ostream& sink);

  std::string NextTraceId();
  void Log(const LogContext& ctx);
  void Error(const LogContext& ctx, const std::string& message);

 private:
  std::ostream& sink_;
  std::mutex mutex_;
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace extauth
