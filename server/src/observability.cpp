/*
 * 설명: 구조화 로그와 토큰/프로비저닝 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/ops/runbook.md, design/protocol/token-api.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "roomgate/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

#include "roomgate/config.hpp"

namespace roomgate {

namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  throw ConfigError("LOG_LEVEL 값이 올바르지 않습니다: " + value);
}

Observability::Observability(LogLevel level) : level_(level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementTokensIssued() { tokens_issued_.fetch_add(1); }

void Observability::IncrementRoomsCreated() { rooms_created_.fetch_add(1); }

void Observability::IncrementRoomsExisting() { rooms_existing_.fetch_add(1); }

void Observability::IncrementProvisionFailure() { provision_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.tokens_issued = tokens_issued_.load();
  snapshot.rooms_created = rooms_created_.load();
  snapshot.rooms_existing = rooms_existing_.load();
  snapshot.provision_failures = provision_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (level_ > LogLevel::kInfo) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["status"] = ctx.status;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.room) {
    log_json["room"] = *ctx.room;
  }
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Observability::Debug(const std::string& trace_id, const std::string& event,
                          const nlohmann::json& fields) const {
  Emit(LogLevel::kDebug, trace_id, event, fields);
}

void Observability::Warn(const std::string& trace_id, const std::string& event,
                         const nlohmann::json& fields) const {
  Emit(LogLevel::kWarn, trace_id, event, fields);
}

void Observability::Error(const std::string& trace_id, const std::string& event,
                          const nlohmann::json& fields) const {
  Emit(LogLevel::kError, trace_id, event, fields);
}

void Observability::Emit(LogLevel level, const std::string& trace_id, const std::string& event,
                         const nlohmann::json& fields) const {
  if (level < level_) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["level"] = LevelName(level);
  log_json["traceId"] = trace_id;
  log_json["eventName"] = event;
  auto& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  // 사용자 입력이 섞일 수 있으므로 항상 dump()로 이스케이프한다.
  out << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace roomgate
