/*
 * 설명: LiveKit RoomService(Twirp over HTTP/HTTPS) CreateRoom 호출 클라이언트.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/room_service_client_test.cpp, server/tests/e2e/token_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core/error.hpp>
#include <boost/beast/http.hpp>

#include "roomgate/config.hpp"
#include "roomgate/room_backend.hpp"
#include "roomgate/token_issuer.hpp"

namespace roomgate {

inline constexpr const char* kCreateRoomPath = "/twirp/livekit.RoomService/CreateRoom";

struct ServiceEndpoint {
  bool tls{false};
  std::string host;
  std::string port;
  std::string base_path;
};

// ws/wss/http/https 만 허용한다. ws 는 http, wss 는 https 로 바꾼다.
std::optional<ServiceEndpoint> ParseServiceEndpoint(const std::string& url);

// CreateRoom 은 이미 있는 룸에도 200 과 기존 Room 을 돌려준다. 응답의 creation_time 이
// requested_at 보다 kExistingRoomSkew 이상 이르면 AlreadyExists 로 분류한다.
inline constexpr std::chrono::seconds kExistingRoomSkew{30};

CreateRoomResult ClassifyCreateRoomResponse(unsigned http_status, const std::string& body,
                                            std::chrono::system_clock::time_point requested_at = {});

class RoomServiceClient : public RoomBackend {
 public:
  RoomServiceClient(IssuerCredentials credentials, std::chrono::milliseconds timeout);

  CreateRoomResult CreateRoom(const RoomOptions& options) override;

 private:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  struct Exchange {
    boost::beast::error_code ec;
    Response response;
  };

  Exchange PostPlain(Request& req) const;
  Exchange PostTls(Request& req) const;

  IssuerCredentials credentials_;
  std::optional<ServiceEndpoint> endpoint_;
  TokenIssuer issuer_;
  std::chrono::milliseconds timeout_;
};

using RoomBackendFactory =
    std::function<std::unique_ptr<RoomBackend>(const IssuerCredentials&, std::chrono::milliseconds)>;

RoomBackendFactory MakeRoomServiceClientFactory();

}  // namespace roomgate
