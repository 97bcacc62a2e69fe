/*
 * 설명: 토큰 발급(JSON), 오류(텍스트), 세션 검증(XML) 응답 본문 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/api_response_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace extauth {

struct GatewayResponse {
  unsigned int status{200};
  std::string content_type;
  std::string body;
};

GatewayResponse MakeJsonResponse(const nlohmann::json& data);
GatewayResponse MakeErrorText(std::string_view message);
GatewayResponse MakeAuthAccepted(std::string_view username);
GatewayResponse MakeAuthRejected(std::string_view message);
GatewayResponse MakeNotImplemented(std::string_view method);

std::string XmlEscape(std::string_view text);

}  // namespace extauth
