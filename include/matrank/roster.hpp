/*
 * 설명: 졸업연도 기준 자격 필터와 선수/팀 표시 정보 병합을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/roster_test.cpp
 */
#pragma once

#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include "matrank/leaderboard.hpp"
#include "matrank/overrides.hpp"

namespace matrank {

struct AthleteInfo {
  std::string name;
  std::optional<std::string> team_id;
  std::optional<std::string> team_name;
  std::optional<std::string> section;
  std::optional<int> division;
  std::optional<int> grad_year;
};

using AthleteInfoMap = std::unordered_map<std::string, AthleteInfo>;
using TeamMetadataMap = std::unordered_map<std::string, TeamMetadata>;

struct RosterContext {
  std::unordered_map<std::string, AthleteProfile> profiles;
  TeamMetadataMap teams;
  std::set<std::string> sections;
  std::set<int> divisions;
};

// 제외 대상은 항상 빠진다. grad_year_filter가 있으면 해당 연도이면서 아직 졸업 전인 선수만,
// 없으면 졸업연도를 모르거나 졸업 전인 선수를 남긴다. 정보가 없는 레이팅 대상도 포함한다.
std::set<std::string> SelectEligibleAthletes(const std::set<std::string>& rated_ids, const AthleteInfoMap& info,
                                             const AthleteOverrides& overrides, std::optional<int> grad_year_filter,
                                             int current_school_year);

// 팀 오버라이드를 반영한 선수 프로필과, 오버라이드 팀 정보 → 자격 선수의 소속 정보 순으로 채운 팀 메타데이터.
RosterContext BuildRosterContext(const AthleteInfoMap& info, const std::set<std::string>& eligible,
                                 const AthleteOverrides& overrides, const TeamMetadataMap& override_team_meta);

}  // namespace matrank
