/*
 * 설명: 승리 유형 코드를 닫힌 열거형으로 변환하고 가중치를 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/glicko2_test.cpp
 */
#include "matrank/match.hpp"

#include <algorithm>
#include <cctype>

namespace matrank {

WinType ParseWinType(const std::optional<std::string>& code) {
  if (!code) {
    return WinType::kOther;
  }
  std::string key = *code;
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::toupper(c); });
  if (key == "F") {
    return WinType::kFall;
  }
  if (key == "TF") {
    return WinType::kTechnicalFall;
  }
  if (key == "MD") {
    return WinType::kMajorDecision;
  }
  if (key == "DEC") {
    return WinType::kDecision;
  }
  return WinType::kOther;
}

double WinTypeWeight(WinType type) {
  switch (type) {
    case WinType::kFall:
      return 1.0;
    case WinType::kTechnicalFall:
      return 0.9;
    case WinType::kMajorDecision:
      return 0.8;
    case WinType::kDecision:
      return 0.7;
    case WinType::kOther:
      break;
  }
  return kOtherWinWeight;
}

}  // namespace matrank
