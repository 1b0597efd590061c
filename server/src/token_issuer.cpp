/*
 * 설명: 세션 토큰과 룸 생성 토큰을 서명해 발급한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/token_issuer_test.cpp
 */
#include "roomgate/token_issuer.hpp"

#include <utility>

namespace roomgate {

TokenIssuer::TokenIssuer(IssuerCredentials credentials) : credentials_(std::move(credentials)) {}

VideoGrant TokenIssuer::SessionGrant(const std::string& room) {
  VideoGrant grant;
  grant.room_join = true;
  grant.room = room;
  grant.can_publish = true;
  grant.can_subscribe = true;
  grant.can_publish_data = true;
  grant.agent = true;
  return grant;
}

IssuedToken TokenIssuer::IssueSessionToken(const std::string& identity, const std::string& room,
                                           std::chrono::system_clock::time_point now) const {
  return Issue(identity, SessionGrant(room), kSessionTokenTtl, now);
}

IssuedToken TokenIssuer::IssueRoomCreateToken(std::chrono::system_clock::time_point now) const {
  VideoGrant grant;
  grant.room_create = true;
  return Issue(std::string{}, grant, kRoomCreateTokenTtl, now);
}

IssuedToken TokenIssuer::Issue(const std::string& identity, const VideoGrant& grant, std::chrono::seconds ttl,
                               std::chrono::system_clock::time_point now) const {
  if (credentials_.api_key.empty()) {
    throw SigningError("API 키가 비어 있습니다");
  }
  IssuedToken issued;
  issued.claims.issuer = credentials_.api_key;
  issued.claims.identity = identity;
  issued.claims.not_before = std::chrono::time_point_cast<std::chrono::seconds>(now);
  issued.claims.expires_at = issued.claims.not_before + ttl;
  issued.claims.video = grant;
  issued.jwt = SignAccessToken(issued.claims, credentials_.api_secret);
  return issued;
}

}  // namespace roomgate
