/*
 * 설명: 쿼리 문자열/폼 본문을 키-값 맵으로 해석한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/request_params_test.cpp
 */
#pragma once

#include <map>
#include <string>
#include <string_view>

namespace extauth {

using Params = std::map<std::string, std::string>;

// '%XX' 와 '+' 를 해석한다. 잘못된 '%' 시퀀스는 글자 그대로 둔다.
std::string PercentDecode(std::string_view raw);

// 값이 빈 쌍은 버리고, 같은 키가 반복되면 뒤의 값이 남는다.
Params ParseFormEncoded(std::string_view raw);

// 요청 target 에서 '?' 이후 부분만 해석한다.
Params ParseTargetQuery(std::string_view target);

}  // namespace extauth
