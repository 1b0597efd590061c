/*
 * 설명: 구조화 로그와 토큰/프로비저닝 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/ops/runbook.md, design/protocol/token-api.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace roomgate {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);

struct LogContext {
  std::string trace_id;
  std::string name;
  unsigned status{0};
  long latency_ms{0};
  std::optional<std::string> room;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t tokens_issued{0};
  std::uint64_t rooms_created{0};
  std::uint64_t rooms_existing{0};
  std::uint64_t provision_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementTokensIssued();
  void IncrementRoomsCreated();
  void IncrementRoomsExisting();
  void IncrementProvisionFailure();
  MetricsSnapshot Snapshot() const;

  // 접근 로그는 stdout, 경고/오류는 stderr 로 한 줄 JSON 을 남긴다.
  void Log(const LogContext& ctx) const;
  void Debug(const std::string& trace_id, const std::string& event, const nlohmann::json& fields) const;
  void Warn(const std::string& trace_id, const std::string& event, const nlohmann::json& fields) const;
  void Error(const std::string& trace_id, const std::string& event, const nlohmann::json& fields) const;

 private:
  void Emit(LogLevel level, const std::string& trace_id, const std::string& event, const nlohmann::json& fields) const;

  LogLevel level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> tokens_issued_{0};
  std::atomic<std::uint64_t> rooms_created_{0};
  std::atomic<std::uint64_t> rooms_existing_{0};
  std::atomic<std::uint64_t> provision_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace roomgate
