/*
 * 설명: HTTP 연결을 처리하고 토큰/헬스/메트릭 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/e2e/token_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "roomgate/observability.hpp"
#include "roomgate/token_service.hpp"

namespace roomgate {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<TokenService> token_service,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleToken(const std::string& query, std::shared_ptr<Response> res);
  void Reply(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<TokenService> token_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::string event_name_;
  std::optional<std::string> log_room_;
};

}  // namespace roomgate
