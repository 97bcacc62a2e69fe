/*
 * 설명: 쿼리 문자열/폼 본문 해석을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/request_params_test.cpp
 */
#include "extauth/request_params.hpp"

namespace extauth {

namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}
}  // namespace

std::string PercentDecode(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    char c = raw[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < raw.size() && HexValue(raw[i + 1]) >= 0 && HexValue(raw[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(raw[i + 1]) * 16 + HexValue(raw[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

Params ParseFormEncoded(std::string_view raw) {
  Params params;
  std::size_t pos = 0;
  while (pos <= raw.size()) {
    auto amp = raw.find('&', pos);
    auto pair = raw.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string_view::npos && eq + 1 < pair.size()) {
      auto key = PercentDecode(pair.substr(0, eq));
      auto value = PercentDecode(pair.substr(eq + 1));
      if (!value.empty()) {
        params[key] = value;
      }
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

Params ParseTargetQuery(std::string_view target) {
  auto qpos = target.find('?');
  if (qpos == std::string_view::npos) {
    return {};
  }
  auto query = target.substr(qpos + 1);
  auto hash = query.find('#');
  if (hash != std::string_view::npos) {
    query = query.substr(0, hash);
  }
  return ParseFormEncoded(query);
}

}  // namespace extauth
