/*
 * 설명: HTTP 요청을 읽어 토큰/헬스/메트릭 경로로 분기하고 JSON 으로 응답한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/e2e/token_flow_test.cpp
 */
#include "roomgate/http_session.hpp"

#include <exception>
#include <optional>
#include <utility>

#include <boost/beast/version.hpp>

#include "roomgate/api_response.hpp"
#include "roomgate/query_string.hpp"

namespace roomgate {

namespace {
constexpr const char* kServerName = "roomgate";
constexpr const char* kVersion = "v1.0.0";

std::optional<std::string> FindParam(const std::unordered_map<std::string, std::string>& params,
                                     const std::string& key) {
  auto it = params.find(key);
  if (it == params.end()) {
    return std::nullopt;
  }
  return it->second;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<TokenService> token_service,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)),
      token_service_(std::move(token_service)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  log_room_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");
  res->set(http::field::cache_control, "no-store");

  auto target = SplitTarget(std::string(req_.target()));
  event_name_ = target.path;

  if (target.path == "/api/token") {
    if (req_.method() != http::verb::get) {
      res->set(http::field::allow, "GET");
      return Reply(res, http::status::method_not_allowed, MakeErrorBody(kMethodNotAllowedMessage));
    }
    return HandleToken(target.query, res);
  }

  if (req_.method() == http::verb::get && target.path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", kVersion}};
    return Reply(res, http::status::ok, payload);
  }

  if (req_.method() == http::verb::get && target.path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"tokens", {{"issued", snapshot.tokens_issued}}},
                        {"provisioning",
                         {{"created", snapshot.rooms_created},
                          {"alreadyExists", snapshot.rooms_existing},
                          {"failures", snapshot.provision_failures}}}};
    return Reply(res, http::status::ok, data);
  }

  Reply(res, http::status::not_found, MakeErrorBody(kNotFoundMessage));
}

void HttpSession::HandleToken(const std::string& query, std::shared_ptr<Response> res) {
  auto params = ParseQueryParams(query);
  TokenRequest request;
  request.room = FindParam(params, "room");
  request.username = FindParam(params, "username");
  request.trace_id = trace_id_;
  try {
    auto reply = token_service_->Handle(request);
    log_room_ = reply.room;
    Reply(res, reply.status, reply.body);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Error(trace_id_, "token_request_failed", {{"reason", ex.what()}});
    }
    Reply(res, boost::beast::http::status::internal_server_error, MakeErrorBody(kInternalErrorMessage));
  }
}

void HttpSession::Reply(std::shared_ptr<Response> res, boost::beast::http::status status,
                        const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->content_length(res->body().size());
  SendResponse(std::move(res));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{trace_id_, event_name_, res->result_int(), static_cast<long>(latency), log_room_});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace roomgate
