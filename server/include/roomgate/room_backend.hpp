/*
 * 설명: 룸 관리 백엔드 호출 인터페이스와 생성 결과 분류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/provisioner_test.cpp, server/tests/unit/room_service_client_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace roomgate {

enum class ProvisionOutcome { kCreated, kAlreadyExists, kTransientFailure, kRejected };

const char* ToString(ProvisionOutcome outcome);

struct RoomOptions {
  std::string name;
  std::chrono::seconds empty_timeout{0};
  std::uint32_t max_participants{0};
  std::string metadata;
};

struct CreateRoomResult {
  ProvisionOutcome outcome{ProvisionOutcome::kTransientFailure};
  unsigned http_status{0};
  std::string message;
};

class RoomBackend {
 public:
  virtual ~RoomBackend() = default;
  // 실패는 예외가 아니라 결과 값으로 보고한다.
  virtual CreateRoomResult CreateRoom(const RoomOptions& options) = 0;
};

}  // namespace roomgate
