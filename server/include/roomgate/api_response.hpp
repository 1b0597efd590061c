/*
 * 설명: 토큰 API 응답 본문 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/api_response_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace roomgate {

inline constexpr std::string_view kMissingParamsMessage = "Missing room or username";
inline constexpr std::string_view kConfigErrorMessage = "Server configuration error";
inline constexpr std::string_view kSigningErrorMessage = "Failed to issue token";
inline constexpr std::string_view kProvisionUnavailableMessage = "Room provisioning unavailable";
inline constexpr std::string_view kProvisionFailedMessage = "Room provisioning failed";
inline constexpr std::string_view kInternalErrorMessage = "Internal server error";
inline constexpr std::string_view kNotFoundMessage = "Not found";
inline constexpr std::string_view kMethodNotAllowedMessage = "Method not allowed";

nlohmann::json MakeTokenBody(const std::string& token, const std::string& url);
nlohmann::json MakeErrorBody(std::string_view message);

}  // namespace roomgate
