/*
 * 설명: 게이트웨이 수명주기, 리스너, TLS 로딩, 환경설정/명령행 해석을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "extauth/app.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "extauth/http_session.hpp"

namespace extauth {

namespace {
// 1..65535 범위의 10진수만 받는다.
std::optional<unsigned short> ParsePort(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 5) {
    return std::nullopt;
  }
  auto port = std::stoul(value);
  if (port == 0 || port > 65535) {
    return std::nullopt;
  }
  return static_cast<unsigned short>(port);
}
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           boost::asio::ssl::context* ssl_context, std::shared_ptr<ProtocolHandler> handler,
           std::shared_ptr<RequestLogger> logger, RequestWorkers& workers)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), ssl_context_(ssl_context),
        handler_(std::move(handler)), logger_(std::move(logger)), request_workers_(workers) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short LocalPort() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            if (self->ssl_context_) {
              std::make_shared<TlsHttpSession>(TlsStream(std::move(socket), *self->ssl_context_), self->handler_,
                                               self->logger_, self->request_workers_)
                  ->Run();
            } else {
              std::make_shared<PlainHttpSession>(PlainStream(std::move(socket)), self->handler_, self->logger_,
                                                 self->request_workers_)
                  ->Run();
            }
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ssl::context* ssl_context_;
  std::shared_ptr<ProtocolHandler> handler_;
  std::shared_ptr<RequestLogger> logger_;
  RequestWorkers& request_workers_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<SessionOracle> oracle,
                     std::shared_ptr<RequestLogger> logger)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), logger_(std::move(logger)) {
  request_tokens_ = std::make_shared<RequestTokenStore>(config.request_token_capacity);
  session_tokens_ = std::make_shared<SessionTokenStore>(config.session_token_capacity);
  RetryPolicy policy;
  policy.attempts = config.session_check_attempts;
  policy.delay = std::chrono::milliseconds(config.session_check_delay_ms);
  session_verifier_ = std::make_shared<SessionVerifier>(std::move(oracle), policy);
  proof_verifier_ = std::make_shared<AccessProofVerifier>(config.authorization_dir, logger_);
  HandlerConfig handler_config;
  handler_config.request_token_ttl = std::chrono::seconds(config.request_token_ttl_seconds);
  handler_config.session_token_ttl = std::chrono::seconds(config.session_token_ttl_seconds);
  handler_ = std::make_shared<ProtocolHandler>(handler_config, request_tokens_, session_tokens_, session_verifier_,
                                               proof_verifier_, logger_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::LoadTlsMaterial() {
  if (config_.certificate_path.empty()) {
    return;
  }
  ssl_context_.emplace(boost::asio::ssl::context::tls_server);
  ssl_context_->set_options(boost::asio::ssl::context::default_workarounds | boost::asio::ssl::context::no_sslv2 |
                            boost::asio::ssl::context::no_sslv3 | boost::asio::ssl::context::no_tlsv1 |
                            boost::asio::ssl::context::no_tlsv1_1);
  ssl_context_->use_certificate_chain_file(config_.certificate_path);
  const auto& key_path = config_.key_path.empty() ? config_.certificate_path : config_.key_path;
  ssl_context_->use_private_key_file(key_path, boost::asio::ssl::context::pem);
}

void ServerApp::Start() {
  LoadTlsMaterial();
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address(config_.bind_address), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, ssl_context_ ? &*ssl_context_ : nullptr, handler_, logger_,
                                         request_workers_);
  listener_->Run();
  running_ = true;
  std::cout << "인증 게이트웨이 시작: " << (IsTls() ? "HTTPS" : "HTTP") << " " << config_.bind_address << ":"
            << BoundPort() << " (종료: Ctrl-C)\n";
  RunWorkers();
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  for (unsigned int i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Wait() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  request_workers_.Join();
  // I/O 스레드가 모두 끝난 뒤에만 acceptor 를 닫는다.
  if (listener_) {
    listener_->Stop();
  }
}

void ServerApp::Run() {
  Start();
  Wait();
}

void ServerApp::Shutdown() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  request_workers_.Stop();
  ioc_.stop();
}

void ServerApp::Stop() {
  Shutdown();
  Wait();
}

void ServerApp::HandleSignals() {
  signals_ = std::make_unique<boost::asio::signal_set>(ioc_, SIGINT, SIGTERM);
  signals_->async_wait([this](const boost::beast::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    std::cout << "신호 " << signal_number << " 수신, 서버를 종료합니다\n";
    Shutdown();
  });
}

unsigned short ServerApp::BoundPort() const { return listener_ ? listener_->LocalPort() : config_.port; }

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  auto port_text = get_env("EXTAUTH_PORT", "8444");
  auto port = ParsePort(port_text);
  if (!port) {
    throw std::invalid_argument("EXTAUTH_PORT 값이 올바르지 않습니다: " + port_text);
  }
  cfg.port = *port;
  cfg.bind_address = get_env("EXTAUTH_BIND_ADDRESS", "127.0.0.1");
  cfg.certificate_path = get_env("EXTAUTH_CERTIFICATE", "");
  cfg.key_path = get_env("EXTAUTH_KEY", "");
  cfg.authorization_dir = get_env("EXTAUTH_AUTHORIZATION_DIR", "/var/spool/dcv_ext_auth");
  cfg.log_file = get_env("EXTAUTH_LOG_FILE", "/var/log/parallelcluster/dcv_ext_auth.log");
  cfg.agent_path = get_env("EXTAUTH_AGENT_PATH", "/usr/libexec/dcv/dcvagent");
  cfg.request_token_capacity = static_cast<std::size_t>(std::stoul(get_env("EXTAUTH_REQUEST_TOKEN_CAPACITY", "500")));
  cfg.request_token_ttl_seconds =
      static_cast<std::size_t>(std::stoul(get_env("EXTAUTH_REQUEST_TOKEN_TTL_SECONDS", "10")));
  cfg.session_token_capacity = static_cast<std::size_t>(std::stoul(get_env("EXTAUTH_SESSION_TOKEN_CAPACITY", "100")));
  cfg.session_token_ttl_seconds =
      static_cast<std::size_t>(std::stoul(get_env("EXTAUTH_SESSION_TOKEN_TTL_SECONDS", "30")));
  cfg.session_check_attempts = static_cast<std::size_t>(std::stoul(get_env("EXTAUTH_SESSION_CHECK_ATTEMPTS", "5")));
  cfg.session_check_delay_ms = static_cast<std::size_t>(std::stoul(get_env("EXTAUTH_SESSION_CHECK_DELAY_MS", "1000")));
  return cfg;
}

bool ApplyCommandLine(int argc, const char* const argv[], AppConfig& config, bool& show_help,
                      std::string& error) {
  show_help = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      show_help = true;
      continue;
    }
    if (arg != "--port" && arg != "--certificate" && arg != "--key") {
      error = "알 수 없는 인자: " + arg;
      return false;
    }
    if (i + 1 >= argc) {
      error = arg + " 에 값이 필요합니다";
      return false;
    }
    std::string value = argv[++i];
    if (arg == "--port") {
      auto port = ParsePort(value);
      if (!port) {
        error = "--port 값이 올바르지 않습니다: " + value;
        return false;
      }
      config.port = *port;
    } else if (arg == "--certificate") {
      config.certificate_path = value;
    } else {
      config.key_path = value;
    }
  }
  return true;
}

std::string UsageText(const std::string& program) {
  std::ostringstream oss;
  oss << "usage: " << program << " [--port PORT] [--certificate PEM] [--key KEY]\n"
      << "  --port PORT         listening port (default 8444)\n"
      << "  --certificate PEM   serve HTTPS with this certificate\n"
      << "  --key KEY           private key, if not included in the certificate\n";
  return oss.str();
}

}  // namespace extauth
