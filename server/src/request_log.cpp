/*
 * 설명: 요청 단위 구조화 로그를 기록한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 */
#include "extauth/request_log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace extauth {

namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}
}  // namespace

RequestLogger::RequestLogger(std::ostream& sink) : sink_(sink) {}

std::string RequestLogger::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void RequestLogger::Log(const LogContext& ctx) {
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["method"] = ctx.method;
  log_json["clientAddress"] = ctx.client_address;
  log_json["timestamp"] = CurrentTimestamp();
  log_json["message"] = ctx.message;
  if (ctx.latency_ms) {
    log_json["latencyMs"] = *ctx.latency_ms;
  }
  auto line = log_json.dump();
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ << line << std::endl;
}

void RequestLogger::Error(const LogContext& ctx, const std::string& message) {
  LogContext entry = ctx;
  entry.message = "ERROR: " + message;
  entry.latency_ms.reset();
  Log(entry);
}

}  // namespace extauth
