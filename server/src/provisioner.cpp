/*
 * 설명: 룸 생성 요청을 구성하고 백엔드 오류를 결과 값으로 정규화한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/provisioner_test.cpp
 */
#include "roomgate/provisioner.hpp"

#include <exception>

#include <nlohmann/json.hpp>

namespace roomgate {

const char* ToString(ProvisionOutcome outcome) {
  switch (outcome) {
    case ProvisionOutcome::kCreated:
      return "created";
    case ProvisionOutcome::kAlreadyExists:
      return "already_exists";
    case ProvisionOutcome::kTransientFailure:
      return "transient_failure";
    case ProvisionOutcome::kRejected:
      return "rejected";
  }
  return "unknown";
}

RoomProvisioner::RoomProvisioner(RoomBackend& backend) : backend_(backend) {}

std::string RoomProvisioner::MakeMetadata(const std::string& created_by) {
  nlohmann::json metadata{{"created_by", created_by}};
  return metadata.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

CreateRoomResult RoomProvisioner::EnsureRoom(const std::string& name, const std::string& created_by) const {
  RoomOptions options;
  options.name = name;
  options.empty_timeout = kRoomEmptyTimeout;
  options.max_participants = kRoomMaxParticipants;
  options.metadata = MakeMetadata(created_by);
  try {
    return backend_.CreateRoom(options);
  } catch (const std::exception& ex) {
    return CreateRoomResult{ProvisionOutcome::kTransientFailure, 0, ex.what()};
  }
}

}  // namespace roomgate
