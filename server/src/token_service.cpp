/*
 * 설명: 토큰 요청을 처리한다. 설정 누락은 500, 입력 누락은 400 으로 부수효과 없이 끝낸다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/token_service_test.cpp, server/tests/e2e/token_flow_test.cpp
 */
#include "roomgate/token_service.hpp"

#include <utility>

#include "roomgate/api_response.hpp"
#include "roomgate/provisioner.hpp"
#include "roomgate/query_string.hpp"
#include "roomgate/token_issuer.hpp"

namespace roomgate {

namespace http = boost::beast::http;

TokenService::TokenService(CredentialSource credential_source, RoomBackendFactory backend_factory,
                           TokenServiceOptions options, std::shared_ptr<Observability> observability)
    : credential_source_(std::move(credential_source)),
      backend_factory_(std::move(backend_factory)),
      options_(options),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>()) {}

TokenReply TokenService::Handle(const TokenRequest& request) const {
  return Handle(request, std::chrono::system_clock::now());
}

TokenReply TokenService::Handle(const TokenRequest& request, std::chrono::system_clock::time_point now) const {
  auto lookup = credential_source_();
  if (!lookup.credentials) {
    observability_->Error(request.trace_id, "config_missing", {{"missingKeys", lookup.missing_keys}});
    return TokenReply{http::status::internal_server_error, MakeErrorBody(kConfigErrorMessage)};
  }
  const auto& credentials = *lookup.credentials;

  auto room = TrimCopy(request.room.value_or(std::string{}));
  auto username = TrimCopy(request.username.value_or(std::string{}));
  if (room.empty() || username.empty()) {
    return TokenReply{http::status::bad_request, MakeErrorBody(kMissingParamsMessage)};
  }

  if (auto failure = Provision(credentials, room, username, request.trace_id)) {
    failure->room = room;
    return *failure;
  }

  try {
    TokenIssuer issuer(credentials);
    auto issued = issuer.IssueSessionToken(username, room, now);
    observability_->IncrementTokensIssued();
    return TokenReply{http::status::ok, MakeTokenBody(issued.jwt, credentials.service_url), room};
  } catch (const SigningError& ex) {
    observability_->Error(request.trace_id, "token_signing_failed", {{"reason", ex.what()}});
    return TokenReply{http::status::internal_server_error, MakeErrorBody(kSigningErrorMessage), room};
  }
}

std::optional<TokenReply> TokenService::Provision(const IssuerCredentials& credentials, const std::string& room,
                                                  const std::string& username, const std::string& trace_id) const {
  auto backend = backend_factory_(credentials, options_.provision_timeout);
  if (!backend) {
    observability_->Error(trace_id, "provision_backend_unavailable", {{"room", room}});
    observability_->IncrementProvisionFailure();
    if (options_.policy == ProvisioningPolicy::kStrict) {
      return TokenReply{http::status::service_unavailable, MakeErrorBody(kProvisionUnavailableMessage)};
    }
    return std::nullopt;
  }

  RoomProvisioner provisioner(*backend);
  auto result = provisioner.EnsureRoom(room, username);
  switch (result.outcome) {
    case ProvisionOutcome::kCreated:
      observability_->IncrementRoomsCreated();
      observability_->Debug(trace_id, "room_created", {{"room", room}});
      return std::nullopt;
    case ProvisionOutcome::kAlreadyExists:
      observability_->IncrementRoomsExisting();
      observability_->Debug(trace_id, "room_exists", {{"room", room}});
      return std::nullopt;
    case ProvisionOutcome::kTransientFailure:
    case ProvisionOutcome::kRejected:
      break;
  }

  observability_->IncrementProvisionFailure();
  observability_->Warn(trace_id, "room_provision_failed",
                       {{"room", room},
                        {"outcome", ToString(result.outcome)},
                        {"httpStatus", result.http_status},
                        {"reason", result.message}});
  if (options_.policy == ProvisioningPolicy::kLenient) {
    // 대부분 이미 존재하는 룸이므로 토큰 발급을 계속한다.
    return std::nullopt;
  }
  if (result.outcome == ProvisionOutcome::kTransientFailure) {
    return TokenReply{http::status::service_unavailable, MakeErrorBody(kProvisionUnavailableMessage)};
  }
  return TokenReply{http::status::bad_gateway, MakeErrorBody(kProvisionFailedMessage)};
}

}  // namespace roomgate
