/*
 * 설명: 서버 수명주기, 리스닝 스레드와 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/e2e/token_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "roomgate/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "roomgate/http_session.hpp"

namespace roomgate {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<TokenService> token_service, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), token_service_(std::move(token_service)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->token_service_, self->observability_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<TokenService> token_service_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : ServerApp(config, EnvCredentialSource(), MakeRoomServiceClientFactory()) {}

ServerApp::ServerApp(const AppConfig& config, CredentialSource credential_source, RoomBackendFactory backend_factory)
    : config_(config), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  TokenServiceOptions options;
  options.policy = config.provisioning_policy;
  options.provision_timeout = std::chrono::milliseconds(config.provision_timeout_ms);
  token_service_ = std::make_shared<TokenService>(std::move(credential_source), std::move(backend_factory), options,
                                                  observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::OpenListener() {
  auto address = boost::asio::ip::make_address(config_.address);
  boost::asio::ip::tcp::endpoint endpoint{address, config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, token_service_, observability_);
  listener_->Run();
  running_ = true;
  std::cout << "서버 시작: " << config_.address << ":" << BoundPort() << "\n";
}

void ServerApp::Run() {
  try {
    OpenListener();
    // 현재 스레드도 run()을 호출하므로 워커는 하나 적게 만든다.
    RunWorkers(WorkerCount() - 1);
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::Start() {
  OpenListener();
  RunWorkers(WorkerCount());
}

void ServerApp::RunWorkers(std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

std::size_t ServerApp::WorkerCount() const {
  if (config_.worker_threads > 0) {
    return config_.worker_threads;
  }
  return std::max(1u, std::thread::hardware_concurrency());
}

unsigned short ServerApp::BoundPort() const { return listener_ ? listener_->Port() : 0; }

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

std::size_t ParseUnsigned(const char* key, const std::string& value, std::size_t max) {
  std::size_t idx = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &idx);
  } catch (const std::exception&) {
    throw ConfigError(std::string(key) + " 값이 숫자가 아닙니다: " + value);
  }
  if (idx != value.size() || value.front() == '-' || parsed > max) {
    throw ConfigError(std::string(key) + " 값이 허용 범위를 벗어났습니다: " + value);
  }
  return static_cast<std::size_t>(parsed);
}
}  // namespace

ProvisioningPolicy ParseProvisioningPolicy(const std::string& value) {
  if (value == "lenient") {
    return ProvisioningPolicy::kLenient;
  }
  if (value == "strict") {
    return ProvisioningPolicy::kStrict;
  }
  throw ConfigError("PROVISIONING_POLICY 값이 올바르지 않습니다: " + value);
}

AppConfig LoadConfigFromEnv() {
  AppConfig cfg;
  cfg.address = GetEnv("SERVER_ADDRESS", "0.0.0.0");
  cfg.port = static_cast<unsigned short>(ParseUnsigned("SERVER_PORT", GetEnv("SERVER_PORT", "8080"), 65535));
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  ParseLogLevel(cfg.log_level);  // 잘못된 값이면 ConfigError
  cfg.provision_timeout_ms = ParseUnsigned("PROVISION_TIMEOUT_MS", GetEnv("PROVISION_TIMEOUT_MS", "3000"), 60000);
  if (cfg.provision_timeout_ms == 0) {
    throw ConfigError("PROVISION_TIMEOUT_MS 는 0 보다 커야 합니다");
  }
  cfg.provisioning_policy = ParseProvisioningPolicy(GetEnv("PROVISIONING_POLICY", "lenient"));
  cfg.worker_threads = ParseUnsigned("WORKER_THREADS", GetEnv("WORKER_THREADS", "0"), 256);
  return cfg;
}

CredentialLookup LoadIssuerCredentialsFromEnv() {
  CredentialLookup lookup;
  IssuerCredentials credentials;
  credentials.api_key = GetEnv(kApiKeyEnv, "");
  credentials.api_secret = GetEnv(kApiSecretEnv, "");
  credentials.service_url = GetEnv(kServiceUrlEnv, "");
  if (credentials.api_key.empty()) {
    lookup.missing_keys.emplace_back(kApiKeyEnv);
  }
  if (credentials.api_secret.empty()) {
    lookup.missing_keys.emplace_back(kApiSecretEnv);
  }
  if (credentials.service_url.empty()) {
    lookup.missing_keys.emplace_back(kServiceUrlEnv);
  }
  if (lookup.missing_keys.empty()) {
    lookup.credentials = std::move(credentials);
  }
  return lookup;
}

CredentialSource EnvCredentialSource() { return [] { return LoadIssuerCredentialsFromEnv(); }; }

}  // namespace roomgate
