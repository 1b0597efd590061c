/*
 * 설명: 서버 환경설정과 발급자 자격 증명 로딩을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/unit/token_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomgate {

inline constexpr const char* kApiKeyEnv = "LIVEKIT_API_KEY";
inline constexpr const char* kApiSecretEnv = "LIVEKIT_API_SECRET";
inline constexpr const char* kServiceUrlEnv = "LIVEKIT_URL";

enum class ProvisioningPolicy { kLenient, kStrict };

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct AppConfig {
  std::string address;
  unsigned short port;
  std::string log_level;
  std::size_t provision_timeout_ms;
  ProvisioningPolicy provisioning_policy;
  std::size_t worker_threads;
};

// 토큰 서명과 룸 생성 호출에 쓰는 키/시크릿/엔드포인트 묶음.
struct IssuerCredentials {
  std::string api_key;
  std::string api_secret;
  std::string service_url;
};

struct CredentialLookup {
  std::optional<IssuerCredentials> credentials;
  std::vector<std::string> missing_keys;
};

// 요청마다 호출된다. 캐시하지 않으므로 재시작 없이 설정 복구가 반영된다.
using CredentialSource = std::function<CredentialLookup()>;

AppConfig LoadConfigFromEnv();
ProvisioningPolicy ParseProvisioningPolicy(const std::string& value);

CredentialLookup LoadIssuerCredentialsFromEnv();
CredentialSource EnvCredentialSource();

}  // namespace roomgate
