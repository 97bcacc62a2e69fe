/*
 * 설명: 게이트웨이 전체 수명주기(리스너, I/O 스레드, 요청 작업 스레드, TLS)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>

#include "extauth/access_proof.hpp"
#include "extauth/config.hpp"
#include "extauth/protocol_handler.hpp"
#include "extauth/request_log.hpp"
#include "extauth/request_workers.hpp"
#include "extauth/session_oracle.hpp"
#include "extauth/token_store.hpp"

namespace extauth {

class Listener;

class ServerApp {
 public:
  ServerApp(const AppConfig& config, std::shared_ptr<SessionOracle> oracle, std::shared_ptr<RequestLogger> logger);
  ~ServerApp();

  // 소켓 바인드, TLS 로드 실패 시 예외를 던진다.
  void Start();
  void Wait();
  void Run();
  void Stop();
  // SIGINT/SIGTERM 수신 시 종료한다. Start 전에 호출한다.
  void HandleSignals();

  unsigned short BoundPort() const;
  bool IsTls() const { return ssl_context_.has_value(); }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ProtocolHandler> GetHandler() { return handler_; }

 private:
  void LoadTlsMaterial();
  void RunWorkers();
  void Shutdown();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  RequestWorkers request_workers_;
  std::optional<boost::asio::ssl::context> ssl_context_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<RequestLogger> logger_;
  std::shared_ptr<RequestTokenStore> request_tokens_;
  std::shared_ptr<SessionTokenStore> session_tokens_;
  std::shared_ptr<SessionVerifier> session_verifier_;
  std::shared_ptr<AccessProofVerifier> proof_verifier_;
  std::shared_ptr<ProtocolHandler> handler_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace extauth
