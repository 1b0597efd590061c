/*
 * 설명: 토큰 API 응답 본문을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/api_response_test.cpp
 */
#include "roomgate/api_response.hpp"

namespace roomgate {

nlohmann::json MakeTokenBody(const std::string& token, const std::string& url) {
  nlohmann::json body;
  body["token"] = token;
  body["url"] = url;
  return body;
}

nlohmann::json MakeErrorBody(std::string_view message) {
  nlohmann::json body;
  body["error"] = std::string(message);
  return body;
}

}  // namespace roomgate
