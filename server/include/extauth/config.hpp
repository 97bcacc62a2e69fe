/*
 * 설명: 인증 게이트웨이 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace extauth {

struct AppConfig {
  unsigned short port;
  std::string bind_address;
  std::string certificate_path;
  std::string key_path;
  std::string authorization_dir;
  std::string log_file;
  std::string agent_path;
  std::size_t request_token_capacity;
  std::size_t request_token_ttl_seconds;
  std::size_t session_token_capacity;
  std::size_t session_token_ttl_seconds;
  std::size_t session_check_attempts;
  std::size_t session_check_delay_ms;
};

AppConfig LoadConfigFromEnv();

// --port, --certificate, --key 로 환경설정을 덮어쓴다.
// 잘못된 인자는 false 와 error 메시지를 돌려준다. --help 는 show_help 만 켠다.
bool ApplyCommandLine(int argc, const char* const argv[], AppConfig& config, bool& show_help,
                      std::string& error);

std::string UsageText(const std::string& program);

}  // namespace extauth
