/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/e2e/token_flow_test.cpp
 */
#include <csignal>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "roomgate/app.hpp"

int main() {
  using namespace roomgate;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const ConfigError& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }

  ServerApp app(config);
  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    std::cout << "시그널 " << signal_number << " 수신, 종료를 준비합니다\n";
    // 워커 스레드 안이므로 join 하지 않고 루프만 멈춘다.
    app.GetContext().stop();
  });

  app.Run();
  app.Stop();
  return 0;
}
