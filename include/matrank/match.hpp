/*
 * 설명: 경기 결과 레코드와 승리 유형 가중치 테이블을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/glicko2_test.cpp
 */
#pragma once

#include <optional>
#include <string>

#include "matrank/calendar.hpp"

namespace matrank {

enum class WinType {
  kFall,
  kTechnicalFall,
  kMajorDecision,
  kDecision,
  kOther,
};

constexpr double kOtherWinWeight = 0.65;

// "F", "TF", "MD", "DEC" 만 인식하며 대소문자를 구분하지 않는다. 나머지는 kOther.
WinType ParseWinType(const std::optional<std::string>& code);
double WinTypeWeight(WinType type);

struct MatchResult {
  std::string id;
  Timestamp date;
  std::string top_id;
  std::string bottom_id;
  std::optional<std::string> winner_id;
  std::optional<std::string> win_type;
  std::optional<std::string> weight_class;

  // 승자가 두 참가자 중 하나일 때만 레이팅에 반영된다.
  bool IsRated() const {
    return winner_id.has_value() && !top_id.empty() && !bottom_id.empty() &&
           (*winner_id == top_id || *winner_id == bottom_id);
  }
  bool TopWon() const { return winner_id.has_value() && *winner_id == top_id; }
  const std::string& LoserId() const { return TopWon() ? bottom_id : top_id; }
};

}  // namespace matrank
