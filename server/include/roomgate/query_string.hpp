/*
 * 설명: 요청 타깃을 경로와 쿼리로 나누고 쿼리 파라미터를 디코딩한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/query_string_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace roomgate {

struct RequestTarget {
  std::string path;
  std::string query;
};

RequestTarget SplitTarget(std::string_view target);

// 키가 중복되면 처음 값이 유지된다. 값은 %XX 와 '+' 를 디코딩한 결과다.
std::unordered_map<std::string, std::string> ParseQueryParams(std::string_view query);

std::string PercentDecode(std::string_view value);
std::string TrimCopy(std::string_view value);

}  // namespace roomgate
