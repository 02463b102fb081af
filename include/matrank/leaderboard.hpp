/*
 * 설명: 체급별 순위표와 팀 로스터를 구성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/leaderboard_test.cpp
 */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "matrank/rating_run.hpp"

namespace matrank {

extern const std::vector<std::string> kDefaultWeightClasses;

struct AthleteProfile {
  std::string name;
  std::optional<std::string> team_id;
  std::optional<int> grad_year;
};

struct WinLossRecord {
  int wins{0};
  int losses{0};
};

struct LeaderboardEntry {
  std::string id;
  std::string name;
  std::optional<std::string> team_id;
  std::optional<int> grad_year;
  double rating;
  double rd;
  double sigma;
  int wins;
  int losses;
};

struct WeightRanking {
  std::string weight_class;
  std::vector<std::string> athlete_ids;
};

struct Leaderboard {
  std::vector<WeightRanking> rankings;
  std::map<std::string, LeaderboardEntry> athletes;

  const WeightRanking* Find(const std::string& weight_class) const;
};

struct TeamMetadata {
  std::optional<std::string> name;
  std::optional<std::string> section;
  std::optional<int> division;
};

struct TeamRoster {
  std::string id;
  std::optional<std::string> name;
  std::optional<int> division;
  std::optional<std::string> section;
  std::vector<WeightRanking> weights;
};

struct LeaderboardRequest {
  std::vector<std::string> weight_classes;
  std::optional<std::size_t> limit;
  std::set<std::string> allowed_ids;
  std::unordered_map<std::string, AthleteProfile> profiles;
  std::unordered_map<std::string, std::string> weight_overrides;
  std::unordered_map<std::string, WinLossRecord> records;
};

std::unordered_map<std::string, WinLossRecord> TallyRecords(const std::vector<MatchResult>& matches);

std::optional<std::string> PrimaryWeightClass(const WeightUsage& usage, const std::string& athlete_id,
                                              const std::unordered_map<std::string, std::string>& overrides);

// 레이팅 내림차순. 인접 레이팅 차이가 1e-6 이하로 이어지는 선수들은 동점 그룹이 되고,
// 그룹 안에서는 ID 순서에서 출발해 상대 전적(승-패)이 앞서는 선수만 앞으로 옮긴다.
std::vector<std::string> RankAthletes(const RatingRunResult& result, std::vector<std::string> candidates);

Leaderboard BuildLeaderboard(const RatingRunResult& result, const LeaderboardRequest& request);

// 팀 이름(소문자) → 팀 ID 순으로 정렬된 로스터를 돌려준다.
std::vector<TeamRoster> BuildTeamRosters(const Leaderboard& leaderboard, const std::vector<std::string>& weight_classes,
                                         const std::unordered_map<std::string, TeamMetadata>& team_metadata);

double RoundTo(double value, int decimals);

}  // namespace matrank
