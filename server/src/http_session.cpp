/*
 * 설명: HTTP(S) 요청을 읽어 메서드별로 프로토콜 핸들러에 분기하고 응답을 쓴다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#include "extauth/http_session.hpp"

#include <exception>
#include <system_error>
#include <type_traits>

#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>

#include "extauth/request_params.hpp"

namespace extauth {

namespace {
constexpr std::chrono::seconds kIoTimeout{30};
}  // namespace

template <typename Stream>
HttpSession<Stream>::HttpSession(Stream stream, std::shared_ptr<ProtocolHandler> handler,
                                 std::shared_ptr<RequestLogger> logger, RequestWorkers& workers)
    : stream_(std::move(stream)), handler_(std::move(handler)), logger_(std::move(logger)), workers_(workers) {}

template <typename Stream>
void HttpSession<Stream>::Run() {
  if constexpr (std::is_same_v<Stream, TlsStream>) {
    DoHandshake();
  } else {
    DoRead();
  }
}

template <typename Stream>
void HttpSession<Stream>::DoHandshake() {
  if constexpr (std::is_same_v<Stream, TlsStream>) {
    auto self = this->shared_from_this();
    boost::beast::get_lowest_layer(stream_).expires_after(kIoTimeout);
    stream_.async_handshake(boost::asio::ssl::stream_base::server, [self](boost::beast::error_code ec) {
      if (ec) {
        if (self->logger_) {
          self->logger_->Error(LogContext{self->logger_->NextTraceId(), "-", self->RemoteIp(), "", std::nullopt},
                               "TLS 핸드셰이크 실패: " + ec.message());
        }
        return;
      }
      self->DoRead();
    });
  }
}

template <typename Stream>
void HttpSession<Stream>::DoRead() {
  auto self = this->shared_from_this();
  req_ = {};
  boost::beast::get_lowest_layer(stream_).expires_after(kIoTimeout);
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

template <typename Stream>
void HttpSession<Stream>::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    return DoClose();
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

template <typename Stream>
void HttpSession<Stream>::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = logger_ ? logger_->NextTraceId() : std::string{};

  LogContext ctx{trace_id_, std::string(req_.method_string()), RemoteIp(), "", std::nullopt};
  auto self = this->shared_from_this();
  auto method = req_.method();
  auto target = std::string(req_.target());
  auto body = req_.body();

  bool spawned = false;
  try {
    spawned = workers_.Spawn([self, ctx, method, target, body]() {
      auto response = self->Dispatch(method, target, body, ctx);
      boost::asio::post(self->stream_.get_executor(), [self, response]() { self->SendResponse(response); });
    });
  } catch (const std::system_error& ex) {
    if (logger_) {
      logger_->Error(ctx, std::string("작업 스레드 생성 실패: ") + ex.what());
    }
  }
  if (!spawned) {
    // 종료 중이거나 스레드를 만들 수 없으면 토큰 없이 바로 거절한다.
    SendResponse(method == boost::beast::http::verb::post ? MakeAuthRejected("Internal error")
                                                           : MakeErrorText("Internal error"));
  }
}

template <typename Stream>
GatewayResponse HttpSession<Stream>::Dispatch(boost::beast::http::verb method, const std::string& target,
                                              const std::string& body, const LogContext& ctx) {
  using boost::beast::http::verb;
  try {
    if (method == verb::get) {
      return handler_->HandleGet(ParseTargetQuery(target), ctx);
    }
    if (method == verb::post) {
      return handler_->HandlePost(ParseFormEncoded(body), ctx);
    }
    return MakeNotImplemented(ctx.method);
  } catch (const std::exception& ex) {
    // 토큰 생성 실패 등은 발급 없이 거절로 끝낸다.
    if (logger_) {
      logger_->Error(ctx, std::string("요청 처리 실패: ") + ex.what());
    }
    return method == verb::post ? MakeAuthRejected("Internal error") : MakeErrorText("Internal error");
  }
}

template <typename Stream>
void HttpSession<Stream>::SendResponse(const GatewayResponse& response) {
  using namespace boost::beast;
  auto self = this->shared_from_this();
  auto res = std::make_shared<http::response<http::string_body>>();
  res->version(req_.version());
  res->result(static_cast<http::status>(response.status));
  res->set(http::field::server, "extauth");
  res->set(http::field::content_type, response.content_type);
  res->keep_alive(false);
  res->body() = response.body;
  res->prepare_payload();

  if (logger_) {
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                         request_start_)
                       .count();
    std::string path(req_.target());
    auto qpos = path.find('?');
    if (qpos != std::string::npos) {
      path.resize(qpos);
    }
    // 토큰이 로그에 남지 않도록 쿼리는 기록하지 않는다.
    logger_->Log(LogContext{trace_id_, std::string(req_.method_string()), RemoteIp(),
                            path + " " + std::to_string(response.status), latency});
  }

  get_lowest_layer(stream_).expires_after(kIoTimeout);
  http::async_write(stream_, *res, [self, res](error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->DoClose();
  });
}

template <typename Stream>
void HttpSession<Stream>::DoClose() {
  if constexpr (std::is_same_v<Stream, TlsStream>) {
    auto self = this->shared_from_this();
    boost::beast::get_lowest_layer(stream_).expires_after(kIoTimeout);
    stream_.async_shutdown([self](boost::beast::error_code /*ec*/) {
      boost::beast::error_code ignored;
      boost::beast::get_lowest_layer(self->stream_).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both,
                                                                      ignored);
    });
  } else {
    boost::beast::error_code ec;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  }
}

template <typename Stream>
std::string HttpSession<Stream>::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = boost::beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

template class HttpSession<PlainStream>;
template class HttpSession<TlsStream>;

}  // namespace extauth
