/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/e2e/token_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "roomgate/config.hpp"
#include "roomgate/observability.hpp"
#include "roomgate/room_service_client.hpp"
#include "roomgate/token_service.hpp"

namespace roomgate {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ServerApp(const AppConfig& config, CredentialSource credential_source, RoomBackendFactory backend_factory);
  ~ServerApp();

  // 현재 스레드에서 io_context 를 돌리며 종료될 때까지 블록한다.
  void Run();
  // 리스너를 열고 워커 스레드만으로 처리한다. 호출 즉시 돌아온다.
  void Start();
  void Stop();

  unsigned short BoundPort() const;
  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<TokenService> GetTokenService() { return token_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void OpenListener();
  void RunWorkers(std::size_t count);
  std::size_t WorkerCount() const;

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<TokenService> token_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace roomgate
