/*
 * 설명: 토큰 요청 흐름(설정 확인 → 입력 검증 → 룸 보장 → 토큰 발급)을 조합한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/token_service_test.cpp, server/tests/e2e/token_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/http/status.hpp>
#include <nlohmann/json.hpp>

#include "roomgate/config.hpp"
#include "roomgate/observability.hpp"
#include "roomgate/room_service_client.hpp"

namespace roomgate {

struct TokenRequest {
  std::optional<std::string> room;
  std::optional<std::string> username;
  std::string trace_id;
};

struct TokenReply {
  boost::beast::http::status status;
  nlohmann::json body;
  // 검증을 통과한 뒤의 응답에만 채워진다. 접근 로그용.
  std::optional<std::string> room;
};

struct TokenServiceOptions {
  ProvisioningPolicy policy{ProvisioningPolicy::kLenient};
  std::chrono::milliseconds provision_timeout{3000};
};

class TokenService {
 public:
  TokenService(CredentialSource credential_source, RoomBackendFactory backend_factory, TokenServiceOptions options,
               std::shared_ptr<Observability> observability);

  TokenReply Handle(const TokenRequest& request) const;
  TokenReply Handle(const TokenRequest& request, std::chrono::system_clock::time_point now) const;

 private:
  // 정책상 요청을 중단해야 하면 응답을 돌려준다.
  std::optional<TokenReply> Provision(const IssuerCredentials& credentials, const std::string& room,
                                      const std::string& username, const std::string& trace_id) const;

  CredentialSource credential_source_;
  RoomBackendFactory backend_factory_;
  TokenServiceOptions options_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace roomgate
