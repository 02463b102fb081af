/*
 * 설명: 선수별 수동 오버라이드(체급, 제외, 졸업연도, 팀)를 검증된 구조체로 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/overrides_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "matrank/observability.hpp"

namespace matrank {

struct AthleteOverrides {
  std::unordered_map<std::string, std::string> weights;
  std::set<std::string> exclude;
  std::unordered_map<std::string, int> grad_years;
  std::unordered_map<std::string, std::string> teams;

  bool Empty() const { return weights.empty() && exclude.empty() && grad_years.empty() && teams.empty(); }
  // 체급/졸업연도/팀 중 하나라도 지정된 선수 ID.
  std::set<std::string> ManualIds() const;
};

// 문자열 값은 체급 오버라이드로 본다. 객체는 weight, exclude, gradYear, teamId 필드를 읽는다.
// 형식이 잘못된 항목은 건너뛰고 경고 로그를 남긴다.
AthleteOverrides ParseOverrides(const nlohmann::json& doc, const std::shared_ptr<Observability>& observability);

// 파일이 없거나 최상위가 객체가 아니면 빈 오버라이드를 돌려준다.
AthleteOverrides LoadOverrides(const std::optional<std::string>& path,
                               const std::shared_ptr<Observability>& observability);

}  // namespace matrank
