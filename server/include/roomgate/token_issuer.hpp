/*
 * 설명: 참가자 세션 토큰과 룸 생성용 관리 토큰의 권한/수명 정책을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/token_issuer_test.cpp
 */
#pragma once

#include <chrono>
#include <string>

#include "roomgate/access_token.hpp"
#include "roomgate/config.hpp"

namespace roomgate {

inline constexpr std::chrono::seconds kSessionTokenTtl{3600};
inline constexpr std::chrono::seconds kRoomCreateTokenTtl{600};

struct IssuedToken {
  std::string jwt;
  AccessTokenClaims claims;
};

class TokenIssuer {
 public:
  explicit TokenIssuer(IssuerCredentials credentials);

  // 권한은 고정이다: room 한정 입장, 발행, 구독, 데이터 발행, 에이전트 배정.
  IssuedToken IssueSessionToken(const std::string& identity, const std::string& room,
                                std::chrono::system_clock::time_point now) const;
  IssuedToken IssueRoomCreateToken(std::chrono::system_clock::time_point now) const;

  static VideoGrant SessionGrant(const std::string& room);

 private:
  IssuedToken Issue(const std::string& identity, const VideoGrant& grant, std::chrono::seconds ttl,
                    std::chrono::system_clock::time_point now) const;

  IssuerCredentials credentials_;
};

}  // namespace roomgate
