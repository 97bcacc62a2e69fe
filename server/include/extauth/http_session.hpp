/*
 * 설명: HTTP(S) 연결 하나를 읽고 프로토콜 핸들러로 넘긴 뒤 응답을 쓴다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "extauth/api_response.hpp"
#include "extauth/protocol_handler.hpp"
#include "extauth/request_log.hpp"
#include "extauth/request_workers.hpp"

namespace extauth {

using PlainStream = boost::beast::tcp_stream;
using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

// 연결당 요청 하나를 처리한다. 핸들러 호출은 요청 전용 작업 스레드에서 실행되므로
// 세션 확인 재시도 대기가 I/O 스레드나 다른 요청을 막지 않는다.
template <typename Stream>
class HttpSession : public std::enable_shared_from_this<HttpSession<Stream>> {
 public:
  HttpSession(Stream stream, std::shared_ptr<ProtocolHandler> handler, std::shared_ptr<RequestLogger> logger,
              RequestWorkers& workers);
  void Run();

 private:
  void DoHandshake();
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  GatewayResponse Dispatch(boost::beast::http::verb method, const std::string& target, const std::string& body,
                           const LogContext& ctx);
  void SendResponse(const GatewayResponse& response);
  void DoClose();
  std::string RemoteIp();

  Stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<ProtocolHandler> handler_;
  std::shared_ptr<RequestLogger> logger_;
  RequestWorkers& workers_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

using PlainHttpSession = HttpSession<PlainStream>;
using TlsHttpSession = HttpSession<TlsStream>;

}  // namespace extauth
