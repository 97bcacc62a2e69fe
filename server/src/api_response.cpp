/*
 * 설명: JSON/텍스트/XML 응답 본문을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/api_response_test.cpp
 */
#include "extauth/api_response.hpp"

namespace extauth {

GatewayResponse MakeJsonResponse(const nlohmann::json& data) {
  return GatewayResponse{200, "application/json", data.dump()};
}

GatewayResponse MakeErrorText(std::string_view message) {
  std::string body(message);
  body.push_back('\n');
  return GatewayResponse{200, "text/plain; charset=utf-8", body};
}

GatewayResponse MakeAuthAccepted(std::string_view username) {
  return GatewayResponse{200, "text/xml",
                         "<auth result=\"yes\"><username>" + XmlEscape(username) + "</username></auth>"};
}

GatewayResponse MakeAuthRejected(std::string_view message) {
  return GatewayResponse{200, "text/xml",
                         "<auth result=\"no\"><message>" + XmlEscape(message) + "</message></auth>"};
}

GatewayResponse MakeNotImplemented(std::string_view method) {
  std::string body = "Unsupported method (" + std::string(method) + ")\n";
  return GatewayResponse{501, "text/plain; charset=utf-8", body};
}

std::string XmlEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

}  // namespace extauth
