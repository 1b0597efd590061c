/*
 * 설명: RoomService CreateRoom 을 HTTP/HTTPS 로 호출하고 응답을 결과 값으로 분류한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/room_service_client_test.cpp, server/tests/e2e/token_flow_test.cpp
 */
#include "roomgate/room_service_client.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace roomgate {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {
constexpr std::size_t kMaxMessageLength = 256;

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool IsValidPort(const std::string& port) {
  if (port.empty() || port.size() > 5) {
    return false;
  }
  if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }
  auto value = std::stoul(port);
  return value >= 1 && value <= 65535;
}

std::string HostHeader(const ServiceEndpoint& endpoint) {
  std::string host = endpoint.host.find(':') != std::string::npos ? "[" + endpoint.host + "]" : endpoint.host;
  const char* default_port = endpoint.tls ? "443" : "80";
  if (endpoint.port == default_port) {
    return host;
  }
  return host + ":" + endpoint.port;
}

// 정수 또는 숫자 문자열(int64 의 protojson 표현) 모두 받는다.
std::optional<std::int64_t> CreationTime(const nlohmann::json& room) {
  if (!room.is_object() || !room.contains("creation_time")) {
    return std::nullopt;
  }
  const auto& value = room["creation_time"];
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (!value.is_string()) {
    return std::nullopt;
  }
  const auto& text = value.get_ref<const std::string&>();
  if (text.empty() || text.size() > 18 ||
      !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }
  return std::stoll(text);
}

template <class Stream, class Finish>
void WriteThenRead(Stream& stream, http::request<http::string_body>& req, beast::flat_buffer& buffer,
                   http::response<http::string_body>& res, Finish finish) {
  http::async_write(stream, req, [&stream, &buffer, &res, finish](beast::error_code write_ec, std::size_t) {
    if (write_ec) {
      finish(write_ec);
      return;
    }
    http::async_read(stream, buffer, res, [finish](beast::error_code read_ec, std::size_t) { finish(read_ec); });
  });
}
}  // namespace

std::optional<ServiceEndpoint> ParseServiceEndpoint(const std::string& url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return std::nullopt;
  }
  ServiceEndpoint endpoint;
  auto scheme = ToLower(url.substr(0, scheme_end));
  if (scheme == "ws" || scheme == "http") {
    endpoint.tls = false;
  } else if (scheme == "wss" || scheme == "https") {
    endpoint.tls = true;
  } else {
    return std::nullopt;
  }

  auto rest = url.substr(scheme_end + 3);
  auto path_start = rest.find_first_of("/?#");
  auto authority = rest.substr(0, path_start);
  if (path_start != std::string::npos && rest[path_start] == '/') {
    auto path = rest.substr(path_start);
    path = path.substr(0, path.find_first_of("?#"));
    while (!path.empty() && path.back() == '/') {
      path.pop_back();
    }
    endpoint.base_path = path;
  }
  if (authority.find('@') != std::string::npos) {
    return std::nullopt;
  }

  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    endpoint.host = authority.substr(1, close - 1);
    auto after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return std::nullopt;
      }
      endpoint.port = after.substr(1);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
      endpoint.host = authority;
    } else {
      endpoint.host = authority.substr(0, colon);
      endpoint.port = authority.substr(colon + 1);
    }
  }
  if (endpoint.host.empty()) {
    return std::nullopt;
  }
  if (endpoint.port.empty()) {
    endpoint.port = endpoint.tls ? "443" : "80";
  }
  if (!IsValidPort(endpoint.port)) {
    return std::nullopt;
  }
  return endpoint;
}

CreateRoomResult ClassifyCreateRoomResponse(unsigned http_status, const std::string& body,
                                            std::chrono::system_clock::time_point requested_at) {
  CreateRoomResult result;
  result.http_status = http_status;
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (http_status >= 200 && http_status < 300) {
    result.outcome = ProvisionOutcome::kCreated;
    auto created_at = CreationTime(parsed);
    auto threshold =
        std::chrono::duration_cast<std::chrono::seconds>((requested_at - kExistingRoomSkew).time_since_epoch());
    if (created_at && *created_at < threshold.count()) {
      result.outcome = ProvisionOutcome::kAlreadyExists;
    }
    return result;
  }

  std::string twirp_code;
  if (parsed.is_object()) {
    if (parsed.contains("code") && parsed["code"].is_string()) {
      twirp_code = parsed["code"].get<std::string>();
    }
    if (parsed.contains("msg") && parsed["msg"].is_string()) {
      result.message = parsed["msg"].get<std::string>();
    }
  }
  if (result.message.empty()) {
    result.message = body.substr(0, kMaxMessageLength);
  }

  if (http_status == 409 || twirp_code == "already_exists") {
    result.outcome = ProvisionOutcome::kAlreadyExists;
  } else if (http_status == 429 || http_status >= 500 || twirp_code == "unavailable" ||
             twirp_code == "deadline_exceeded") {
    result.outcome = ProvisionOutcome::kTransientFailure;
  } else {
    result.outcome = ProvisionOutcome::kRejected;
  }
  return result;
}

RoomServiceClient::RoomServiceClient(IssuerCredentials credentials, std::chrono::milliseconds timeout)
    : credentials_(std::move(credentials)),
      endpoint_(ParseServiceEndpoint(credentials_.service_url)),
      issuer_(credentials_),
      timeout_(timeout) {}

CreateRoomResult RoomServiceClient::CreateRoom(const RoomOptions& options) {
  if (!endpoint_) {
    return CreateRoomResult{ProvisionOutcome::kRejected, 0, "서비스 URL 형식이 올바르지 않습니다"};
  }
  nlohmann::json body{{"name", options.name},
                      {"empty_timeout", options.empty_timeout.count()},
                      {"max_participants", options.max_participants},
                      {"metadata", options.metadata}};

  Request req{http::verb::post, endpoint_->base_path + kCreateRoomPath, 11};
  req.set(http::field::host, HostHeader(*endpoint_));
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::content_type, "application/json");
  auto requested_at = std::chrono::system_clock::now();
  try {
    auto admin = issuer_.IssueRoomCreateToken(requested_at);
    req.set(http::field::authorization, "Bearer " + admin.jwt);
    req.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    req.prepare_payload();

    auto exchange = endpoint_->tls ? PostTls(req) : PostPlain(req);
    if (exchange.ec) {
      return CreateRoomResult{ProvisionOutcome::kTransientFailure, 0, exchange.ec.message()};
    }
    return ClassifyCreateRoomResponse(exchange.response.result_int(), exchange.response.body(), requested_at);
  } catch (const SigningError& ex) {
    return CreateRoomResult{ProvisionOutcome::kRejected, 0, ex.what()};
  } catch (const boost::system::system_error& ex) {
    return CreateRoomResult{ProvisionOutcome::kTransientFailure, 0, ex.what()};
  }
}

// 전용 io_context 를 timeout_ 동안만 돌린다. 끝나지 않은 작업은 소멸과 함께 버려진다.
RoomServiceClient::Exchange RoomServiceClient::PostPlain(Request& req) const {
  Exchange result;
  bool done = false;
  auto finish = [&result, &done](beast::error_code ec) {
    result.ec = ec;
    done = true;
  };

  net::io_context ioc;
  tcp::resolver resolver{ioc};
  beast::tcp_stream stream{ioc};
  beast::flat_buffer buffer;

  resolver.async_resolve(
      endpoint_->host, endpoint_->port,
      [&](beast::error_code resolve_ec, tcp::resolver::results_type results) {
        if (resolve_ec) {
          finish(resolve_ec);
          return;
        }
        stream.async_connect(results, [&](beast::error_code connect_ec, const tcp::endpoint&) {
          if (connect_ec) {
            finish(connect_ec);
            return;
          }
          WriteThenRead(stream, req, buffer, result.response, finish);
        });
      });

  ioc.run_for(timeout_);
  if (!done) {
    result.ec = net::error::timed_out;
    return result;
  }
  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
  return result;
}

RoomServiceClient::Exchange RoomServiceClient::PostTls(Request& req) const {
  Exchange result;
  bool done = false;
  auto finish = [&result, &done](beast::error_code ec) {
    result.ec = ec;
    done = true;
  };

  net::io_context ioc;
  net::ssl::context ssl_ctx{net::ssl::context::tls_client};
  ssl_ctx.set_default_verify_paths(result.ec);
  if (result.ec) {
    return result;
  }
  ssl_ctx.set_verify_mode(net::ssl::verify_peer);

  tcp::resolver resolver{ioc};
  beast::ssl_stream<beast::tcp_stream> stream{ioc, ssl_ctx};
  if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_->host.c_str())) {
    result.ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
    return result;
  }
  stream.set_verify_callback(net::ssl::host_name_verification(endpoint_->host));
  beast::flat_buffer buffer;

  resolver.async_resolve(
      endpoint_->host, endpoint_->port,
      [&](beast::error_code resolve_ec, tcp::resolver::results_type results) {
        if (resolve_ec) {
          finish(resolve_ec);
          return;
        }
        beast::get_lowest_layer(stream).async_connect(
            results, [&](beast::error_code connect_ec, const tcp::endpoint&) {
              if (connect_ec) {
                finish(connect_ec);
                return;
              }
              stream.async_handshake(net::ssl::stream_base::client, [&](beast::error_code handshake_ec) {
                if (handshake_ec) {
                  finish(handshake_ec);
                  return;
                }
                WriteThenRead(stream, req, buffer, result.response, finish);
              });
            });
      });

  ioc.run_for(timeout_);
  if (!done) {
    result.ec = net::error::timed_out;
  }
  return result;
}

RoomBackendFactory MakeRoomServiceClientFactory() {
  return [](const IssuerCredentials& credentials,
            std::chrono::milliseconds timeout) -> std::unique_ptr<RoomBackend> {
    return std::make_unique<RoomServiceClient>(credentials, timeout);
  };
}

}  // namespace roomgate
