/*
 * 설명: 룸 접근 토큰(HS256 JWT)의 클레임, 서명과 검증을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/access_token_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace roomgate {

class SigningError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// 토큰의 "video" 클레임. false 인 권한과 빈 room 은 직렬화하지 않는다.
struct VideoGrant {
  bool room_create{false};
  bool room_join{false};
  std::string room;
  bool can_publish{false};
  bool can_subscribe{false};
  bool can_publish_data{false};
  bool agent{false};
};

bool operator==(const VideoGrant& lhs, const VideoGrant& rhs);

nlohmann::json ToJson(const VideoGrant& grant);
VideoGrant VideoGrantFromJson(const nlohmann::json& j);

struct AccessTokenClaims {
  std::string issuer;
  std::string identity;
  std::chrono::system_clock::time_point not_before;
  std::chrono::system_clock::time_point expires_at;
  VideoGrant video;
};

// 실패하면 SigningError 를 던진다.
std::string SignAccessToken(const AccessTokenClaims& claims, const std::string& secret);

// 서명이 맞고 not_before <= now < expires_at 일 때만 클레임을 돌려준다.
std::optional<AccessTokenClaims> VerifyAccessToken(const std::string& token, const std::string& secret,
                                                   std::chrono::system_clock::time_point now);

}  // namespace roomgate
