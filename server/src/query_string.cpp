/*
 * 설명: 요청 타깃 분리, 쿼리 파라미터 파싱과 퍼센트 디코딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/token-api.md
 * 테스트: server/tests/unit/query_string_test.cpp
 */
#include "roomgate/query_string.hpp"

namespace roomgate {

namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool IsSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }
}  // namespace

RequestTarget SplitTarget(std::string_view target) {
  RequestTarget out;
  auto qpos = target.find('?');
  if (qpos == std::string_view::npos) {
    out.path = std::string(target);
    return out;
  }
  out.path = std::string(target.substr(0, qpos));
  out.query = std::string(target.substr(qpos + 1));
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(std::string_view query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string_view::npos) {
        params.emplace(PercentDecode(pair), std::string{});
      } else {
        params.emplace(PercentDecode(pair.substr(0, eq)), PercentDecode(pair.substr(eq + 1)));
      }
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::string PercentDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out.push_back(' ');
      continue;
    }
    if (c == '%' && i + 2 < value.size()) {
      int hi = HexValue(value[i + 1]);
      int lo = HexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    // 잘못된 이스케이프는 원문 그대로 둔다.
    out.push_back(c);
  }
  return out;
}

std::string TrimCopy(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && IsSpace(value[begin])) {
    ++begin;
  }
  while (end > begin && IsSpace(value[end - 1])) {
    --end;
  }
  return std::string(value.substr(begin, end - begin));
}

}  // namespace roomgate
