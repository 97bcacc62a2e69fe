/*
 * 설명: 게이트웨이 진입점으로 설정을 읽고 인증 디렉터리/로그 파일을 준비해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <sys/stat.h>

#include "extauth/access_proof.hpp"
#include "extauth/app.hpp"

int main(int argc, char* argv[]) {
  using namespace extauth;
  try {
    AppConfig config = LoadConfigFromEnv();
    bool show_help = false;
    std::string error;
    if (!ApplyCommandLine(argc, argv, config, show_help, error)) {
      std::cerr << error << "\n" << UsageText(argv[0]);
      return 1;
    }
    if (show_help) {
      std::cout << UsageText(argv[0]);
      return 0;
    }

    std::string reset_error;
    if (!ResetAuthorizationDir(config.authorization_dir, reset_error)) {
      std::cerr << "인증 디렉터리 정리 실패: " << reset_error << "\n";
    }

    std::ofstream log_file(config.log_file, std::ios::app);
    if (!log_file) {
      throw std::runtime_error("로그 파일을 열 수 없습니다: " + config.log_file);
    }
    if (::chmod(config.log_file.c_str(), 0644) != 0) {
      std::cerr << "로그 파일 권한 변경 실패: " << config.log_file << "\n";
    }

    auto logger = std::make_shared<RequestLogger>(log_file);
    auto oracle = std::make_shared<ProcessTableOracle>(config.agent_path);
    ServerApp app(config, oracle, logger);
    app.HandleSignals();
    app.Run();
    std::cout << "서버를 종료합니다\n";
  } catch (const std::exception& ex) {
    std::cerr << "예상하지 못한 오류: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
