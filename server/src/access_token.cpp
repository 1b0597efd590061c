/*
 * 설명: HS256 JWT 인코딩, HMAC 서명, 상수 시간 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/access_token_test.cpp
 */
#include "roomgate/access_token.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace roomgate {

namespace {
constexpr const char* kAlgorithm = "HS256";

std::string Base64UrlEncode(std::string_view input) {
  std::string out(4 * ((input.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(input.data()),
                                static_cast<int>(input.size()));
  out.resize(static_cast<std::size_t>(written));
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  for (auto& c : out) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return out;
}

std::optional<std::string> Base64UrlDecode(std::string_view input) {
  std::string b64(input);
  for (auto& c : b64) {
    if (c == '-') {
      c = '+';
    } else if (c == '_') {
      c = '/';
    } else if (c == '+' || c == '/' || c == '=') {
      return std::nullopt;
    }
  }
  std::size_t padding = (4 - b64.size() % 4) % 4;
  if (padding == 3) {
    return std::nullopt;
  }
  b64.append(padding, '=');
  std::string out(b64.size() / 4 * 3, '\0');
  int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(b64.data()),
                                static_cast<int>(b64.size()));
  if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
    return std::nullopt;
  }
  // EVP_DecodeBlock 은 패딩 자리도 0 바이트로 채워 길이에 포함한다.
  out.resize(static_cast<std::size_t>(decoded) - padding);
  return out;
}

std::string HmacSha256(const std::string& key, std::string_view data) {
  if (key.empty()) {
    throw SigningError("서명 시크릿이 비어 있습니다");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &digest_len) == nullptr) {
    throw SigningError("HMAC-SHA256 계산에 실패했습니다");
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::int64_t ToEpochSeconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochSeconds(std::int64_t seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

std::vector<std::string_view> SplitSegments(std::string_view token) {
  std::vector<std::string_view> parts;
  std::size_t pos = 0;
  while (true) {
    auto dot = token.find('.', pos);
    if (dot == std::string_view::npos) {
      parts.push_back(token.substr(pos));
      break;
    }
    parts.push_back(token.substr(pos, dot - pos));
    pos = dot + 1;
  }
  return parts;
}
}  // namespace

bool operator==(const VideoGrant& lhs, const VideoGrant& rhs) {
  return lhs.room_create == rhs.room_create && lhs.room_join == rhs.room_join && lhs.room == rhs.room &&
         lhs.can_publish == rhs.can_publish && lhs.can_subscribe == rhs.can_subscribe &&
         lhs.can_publish_data == rhs.can_publish_data && lhs.agent == rhs.agent;
}

nlohmann::json ToJson(const VideoGrant& grant) {
  nlohmann::json j = nlohmann::json::object();
  if (grant.room_create) {
    j["roomCreate"] = true;
  }
  if (grant.room_join) {
    j["roomJoin"] = true;
  }
  if (!grant.room.empty()) {
    j["room"] = grant.room;
  }
  if (grant.can_publish) {
    j["canPublish"] = true;
  }
  if (grant.can_subscribe) {
    j["canSubscribe"] = true;
  }
  if (grant.can_publish_data) {
    j["canPublishData"] = true;
  }
  if (grant.agent) {
    j["agent"] = true;
  }
  return j;
}

VideoGrant VideoGrantFromJson(const nlohmann::json& j) {
  VideoGrant grant;
  grant.room_create = j.value("roomCreate", false);
  grant.room_join = j.value("roomJoin", false);
  grant.room = j.value("room", std::string{});
  grant.can_publish = j.value("canPublish", false);
  grant.can_subscribe = j.value("canSubscribe", false);
  grant.can_publish_data = j.value("canPublishData", false);
  grant.agent = j.value("agent", false);
  return grant;
}

std::string SignAccessToken(const AccessTokenClaims& claims, const std::string& secret) {
  nlohmann::json header{{"alg", kAlgorithm}, {"typ", "JWT"}};
  nlohmann::json payload;
  payload["iss"] = claims.issuer;
  if (!claims.identity.empty()) {
    payload["sub"] = claims.identity;
    payload["jti"] = claims.identity;
  }
  payload["nbf"] = ToEpochSeconds(claims.not_before);
  payload["exp"] = ToEpochSeconds(claims.expires_at);
  payload["video"] = ToJson(claims.video);

  std::string signing_input;
  try {
    signing_input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(payload.dump());
  } catch (const nlohmann::json::exception& ex) {
    // identity/room 이 올바른 UTF-8 이 아니면 직렬화가 실패한다.
    throw SigningError(std::string("클레임 직렬화 실패: ") + ex.what());
  }
  return signing_input + "." + Base64UrlEncode(HmacSha256(secret, signing_input));
}

std::optional<AccessTokenClaims> VerifyAccessToken(const std::string& token, const std::string& secret,
                                                   std::chrono::system_clock::time_point now) {
  if (secret.empty()) {
    return std::nullopt;
  }
  auto parts = SplitSegments(token);
  if (parts.size() != 3) {
    return std::nullopt;
  }
  auto header_raw = Base64UrlDecode(parts[0]);
  auto payload_raw = Base64UrlDecode(parts[1]);
  auto signature = Base64UrlDecode(parts[2]);
  if (!header_raw || !payload_raw || !signature) {
    return std::nullopt;
  }

  std::string signing_input = std::string(parts[0]) + "." + std::string(parts[1]);
  auto expected = HmacSha256(secret, signing_input);
  if (expected.size() != signature->size() ||
      CRYPTO_memcmp(expected.data(), signature->data(), expected.size()) != 0) {
    return std::nullopt;
  }

  try {
    auto header = nlohmann::json::parse(*header_raw);
    if (!header.is_object() || header.value("alg", std::string{}) != kAlgorithm) {
      return std::nullopt;
    }
    auto payload = nlohmann::json::parse(*payload_raw);
    if (!payload.is_object() || !payload.contains("exp") || !payload["exp"].is_number_integer() ||
        !payload.contains("nbf") || !payload["nbf"].is_number_integer()) {
      return std::nullopt;
    }
    AccessTokenClaims claims;
    claims.issuer = payload.value("iss", std::string{});
    claims.identity = payload.value("sub", std::string{});
    claims.not_before = FromEpochSeconds(payload["nbf"].get<std::int64_t>());
    claims.expires_at = FromEpochSeconds(payload["exp"].get<std::int64_t>());
    if (payload.contains("video")) {
      if (!payload["video"].is_object()) {
        return std::nullopt;
      }
      claims.video = VideoGrantFromJson(payload["video"]);
    }
    if (now < claims.not_before || now >= claims.expires_at) {
      return std::nullopt;
    }
    return claims;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

}  // namespace roomgate
