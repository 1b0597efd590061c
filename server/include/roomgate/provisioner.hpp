/*
 * 설명: 토큰 발급 전에 고정 정책(빈 방 유지 10분, 정원 2명)으로 룸을 보장한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/provisioner_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "roomgate/room_backend.hpp"

namespace roomgate {

inline constexpr std::chrono::seconds kRoomEmptyTimeout{600};
inline constexpr std::uint32_t kRoomMaxParticipants = 2;

class RoomProvisioner {
 public:
  explicit RoomProvisioner(RoomBackend& backend);

  // 락 없이 백엔드에 생성을 요청한다. 동시 생성 경쟁은 백엔드의 멱등성에 맡긴다.
  CreateRoomResult EnsureRoom(const std::string& name, const std::string& created_by) const;

  static std::string MakeMetadata(const std::string& created_by);

 private:
  RoomBackend& backend_;
};

}  // namespace roomgate
