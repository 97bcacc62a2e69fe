#include <chrono>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "extauth/app.hpp"
#include "extauth/token_generator.hpp"
#include "extauth/validation.hpp"
#include "../helpers/test_support.hpp"
#include "../helpers/tls_material.hpp"

namespace {

struct SimpleHttpResponse {
  boost::beast::http::status status;
  std::string content_type;
  std::string body;
};

extauth::AppConfig TestConfig(const std::string& authorization_dir) {
  extauth::AppConfig cfg = extauth::LoadConfigFromEnv();
  cfg.port = 0;
  cfg.bind_address = "127.0.0.1";
  cfg.certificate_path.clear();
  cfg.key_path.clear();
  cfg.authorization_dir = authorization_dir;
  cfg.request_token_capacity = 500;
  cfg.request_token_ttl_seconds = 10;
  cfg.session_token_capacity = 100;
  cfg.session_token_ttl_seconds = 30;
  cfg.session_check_attempts = 2;
  cfg.session_check_delay_ms = 10;
  return cfg;
}

template <typename Stream>
SimpleHttpResponse Exchange(Stream& stream, boost::beast::http::verb verb, const std::string& target,
                            const std::string& body) {
  boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
  req.set(boost::beast::http::field::host, "localhost");
  req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  if (verb == boost::beast::http::verb::post) {
    req.set(boost::beast::http::field::content_type, "application/x-www-form-urlencoded");
    req.body() = body;
  }
  req.prepare_payload();
  boost::beast::http::write(stream, req);

  boost::beast::flat_buffer buffer;
  boost::beast::http::response<boost::beast::http::string_body> res;
  boost::beast::http::read(stream, buffer, res);
  return SimpleHttpResponse{res.result(), std::string(res[boost::beast::http::field::content_type]), res.body()};
}

class GatewayFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    user_ = extauth::testing::CurrentUserName();
    if (!extauth::IsValidUser(user_)) {
      GTEST_SKIP() << "current account name is not a POSIX-style name: " << user_;
    }
    oracle_ = std::make_shared<extauth::testing::FakeSessionOracle>();
    oracle_->AddSession(user_, "sess1");
    logger_ = std::make_shared<extauth::RequestLogger>(log_);
    auto cfg = TestConfig(dir_.Path());
    Configure(cfg);
    app_ = std::make_unique<extauth::ServerApp>(cfg, oracle_, logger_);
    app_->Start();
    port_ = app_->BoundPort();
  }

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
  }

  virtual void Configure(extauth::AppConfig& /*cfg*/) {}

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target, const std::string& body = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(port_));
    if (tls_) {
      boost::asio::ssl::context ctx{boost::asio::ssl::context::tls_client};
      // 자체 서명 인증서이므로 검증하지 않는다.
      ctx.set_verify_mode(boost::asio::ssl::verify_none);
      boost::beast::ssl_stream<boost::beast::tcp_stream> stream{ioc, ctx};
      boost::beast::get_lowest_layer(stream).connect(results);
      stream.handshake(boost::asio::ssl::stream_base::client);
      auto result = Exchange(stream, verb, target, body);
      boost::beast::error_code ec;
      // 서버가 먼저 닫으면 eof/stream_truncated 가 올 수 있다.
      stream.shutdown(ec);
      return result;
    }
    boost::beast::tcp_stream stream{ioc};
    stream.connect(results);
    auto result = Exchange(stream, verb, target, body);
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse Get(const std::string& target) { return Send(boost::beast::http::verb::get, target); }

  SimpleHttpResponse Post(const std::string& form) { return Send(boost::beast::http::verb::post, "/", form); }

  nlohmann::json RequestToken(const std::string& user, const std::string& session_id) {
    auto res = Get("/?action=requestToken&authUser=" + user + "&sessionID=" + session_id);
    EXPECT_EQ(res.status, boost::beast::http::status::ok);
    EXPECT_EQ(res.content_type, "application/json") << res.body;
    return nlohmann::json::parse(res.body);
  }

  void RunHandshake() {
    auto grant = RequestToken(user_, "sess1");
    auto request_token = grant["requestToken"].get<std::string>();
    auto access_file = grant["accessFile"].get<std::string>();
    EXPECT_TRUE(extauth::IsValidToken(request_token));

    extauth::testing::CreateAccessFile(dir_.Path(), access_file);
    auto session_res = Get("/?action=sessionToken&requestToken=" + request_token);
    EXPECT_EQ(session_res.status, boost::beast::http::status::ok);
    auto session_token = nlohmann::json::parse(session_res.body)["sessionToken"].get<std::string>();

    auto auth = Post("authenticationToken=" + session_token + "&sessionId=sess1");
    EXPECT_EQ(auth.status, boost::beast::http::status::ok);
    EXPECT_EQ(auth.content_type, "text/xml");
    EXPECT_EQ(auth.body, "<auth result=\"yes\"><username>" + user_ + "</username></auth>");

    auto replay = Post("authenticationToken=" + session_token + "&sessionId=sess1");
    EXPECT_EQ(replay.status, boost::beast::http::status::ok);
    EXPECT_EQ(replay.body, "<auth result=\"no\"><message>The session token is not valid</message></auth>");
  }

  std::string user_;
  extauth::testing::TempDir dir_;
  std::ostringstream log_;
  std::shared_ptr<extauth::testing::FakeSessionOracle> oracle_;
  std::shared_ptr<extauth::RequestLogger> logger_;
  std::unique_ptr<extauth::ServerApp> app_;
  unsigned short port_{0};
  bool tls_{false};
};

// 인증서 파일 하나에 개인키까지 들어 있는 배치.
class TlsGatewayFixture : public GatewayFixture {
 protected:
  void Configure(extauth::AppConfig& cfg) override {
    tls_files_ = extauth::testing::WriteSelfSignedCertificate(tls_dir_.Path());
    cfg.certificate_path = tls_files_.combined;
    tls_ = true;
  }

  extauth::testing::TempDir tls_dir_;
  extauth::testing::TlsFiles tls_files_;
};

// --key 로 개인키를 따로 주는 배치.
class TlsSeparateKeyFixture : public TlsGatewayFixture {
 protected:
  void Configure(extauth::AppConfig& cfg) override {
    TlsGatewayFixture::Configure(cfg);
    cfg.certificate_path = tls_files_.certificate;
    cfg.key_path = tls_files_.key;
  }
};

// 없는 세션 확인이 각각 2초씩 걸리는 배치.
class SlowSessionCheckFixture : public GatewayFixture {
 protected:
  void Configure(extauth::AppConfig& cfg) override {
    cfg.session_check_attempts = 3;
    cfg.session_check_delay_ms = 1000;
  }
};

}  // namespace

TEST_F(GatewayFixture, EndToEndHandshake) { RunHandshake(); }

TEST_F(TlsGatewayFixture, EndToEndHandshakeWithKeyInCertificate) {
  EXPECT_TRUE(app_->IsTls());
  RunHandshake();
}

TEST_F(TlsSeparateKeyFixture, EndToEndHandshakeWithSeparateKey) {
  EXPECT_TRUE(app_->IsTls());
  RunHandshake();
}

TEST_F(TlsGatewayFixture, PlainHttpClientGetsNoAnswer) {
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::resolver resolver{ioc};
  boost::beast::tcp_stream stream{ioc};
  stream.connect(resolver.resolve("127.0.0.1", std::to_string(port_)));
  EXPECT_ANY_THROW(Exchange(stream, boost::beast::http::verb::get, "/?action=requestToken", ""));
}

TEST_F(SlowSessionCheckFixture, SlowSessionChecksDoNotDelayValidation) {
  constexpr int kBogusClients = 20;
  std::vector<std::thread> clients;
  for (int i = 0; i < kBogusClients; ++i) {
    clients.emplace_back([this] { Get("/?action=requestToken&authUser=" + user_ + "&sessionID=nosuch"); });
  }
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (oracle_->Calls() < kBogusClients && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_GE(oracle_->Calls(), kBogusClients);

  auto started = std::chrono::steady_clock::now();
  auto res = Post("authenticationToken=" + extauth::GenerateToken() + "&sessionId=sess1");
  auto waited = std::chrono::steady_clock::now() - started;
  EXPECT_EQ(res.body, "<auth result=\"no\"><message>The session token is not valid</message></auth>");
  EXPECT_LT(waited, std::chrono::milliseconds(1000));

  for (auto& c : clients) {
    c.join();
  }
}

TEST_F(GatewayFixture, RequestTokenCannotBeExchangedTwice) {
  auto grant = RequestToken(user_, "sess1");
  auto request_token = grant["requestToken"].get<std::string>();
  extauth::testing::CreateAccessFile(dir_.Path(), grant["accessFile"].get<std::string>());
  auto first = Get("/?action=sessionToken&requestToken=" + request_token);
  EXPECT_EQ(first.content_type, "application/json");
  auto second = Get("/?action=sessionToken&requestToken=" + request_token);
  EXPECT_EQ(second.status, boost::beast::http::status::ok);
  EXPECT_EQ(second.body, "The requestToken parameter is not valid\n");
}

TEST_F(GatewayFixture, MalformedUserIsRejectedWithTextLine) {
  auto res = Get("/?action=requestToken&authUser=Alice&sessionID=sess1");
  EXPECT_EQ(res.status, boost::beast::http::status::ok);
  EXPECT_EQ(res.body, "The authUser parameter is not valid\n");
  EXPECT_EQ(oracle_->Calls(), 0);
}

TEST_F(GatewayFixture, UnknownSessionIsRejected) {
  auto res = Get("/?action=requestToken&authUser=" + user_ + "&sessionID=nosuch");
  EXPECT_EQ(res.body, "The given session for the user does not exist\n");
  EXPECT_EQ(oracle_->Calls(), 2);
}

TEST_F(GatewayFixture, UnsupportedMethod) {
  auto res = Send(boost::beast::http::verb::put, "/");
  EXPECT_EQ(res.status, boost::beast::http::status::not_implemented);
}

TEST_F(GatewayFixture, ConcurrentIssuanceYieldsDistinctTokens) {
  constexpr int kClients = 12;
  std::vector<std::string> tokens(kClients);
  std::vector<std::thread> clients;
  for (int i = 0; i < kClients; ++i) {
    clients.emplace_back([this, i, &tokens] {
      auto res = Get("/?action=requestToken&authUser=" + user_ + "&sessionID=sess1");
      auto body = nlohmann::json::parse(res.body, nullptr, false);
      if (body.is_object() && body.contains("requestToken")) {
        tokens[i] = body["requestToken"].get<std::string>();
      }
    });
  }
  for (auto& c : clients) {
    c.join();
  }
  std::set<std::string> unique;
  for (const auto& t : tokens) {
    EXPECT_TRUE(extauth::IsValidToken(t));
    unique.insert(t);
  }
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kClients));
}

TEST_F(GatewayFixture, RequestLogOmitsTokens) {
  auto grant = RequestToken(user_, "sess1");
  Get("/?action=sessionToken&requestToken=" + grant["requestToken"].get<std::string>());
  app_->Stop();
  auto text = log_.str();
  EXPECT_NE(text.find("\"clientAddress\":\"127.0.0.1\""), std::string::npos);
  EXPECT_NE(text.find("\"method\":\"GET\""), std::string::npos);
  EXPECT_EQ(text.find(grant["requestToken"].get<std::string>()), std::string::npos);
}

TEST(GatewayStartupTest, MissingTlsMaterialIsFatal) {
  extauth::testing::TempDir dir;
  auto cfg = TestConfig(dir.Path());
  cfg.certificate_path = dir.Path() + "/missing.pem";
  std::ostringstream sink;
  extauth::ServerApp app(cfg, std::make_shared<extauth::testing::FakeSessionOracle>(),
                         std::make_shared<extauth::RequestLogger>(sink));
  EXPECT_ANY_THROW(app.Start());
}
