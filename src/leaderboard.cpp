/*
 * 설명: 체급별 순위 정렬, 상대 전적 타이브레이크, 팀 로스터 집계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/leaderboard_test.cpp
 */
#include "matrank/leaderboard.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>

namespace matrank {
namespace {
constexpr double kRatingTieEpsilon = 1e-6;

int HeadToHeadCount(const HeadToHead& head_to_head, const std::string& winner, const std::string& loser) {
  auto it = head_to_head.find({winner, loser});
  return it == head_to_head.end() ? 0 : it->second;
}

std::string Lower(const std::optional<std::string>& text) {
  std::string out = text.value_or("");
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

WeightRanking& RankingFor(std::vector<WeightRanking>& weights, const std::string& weight_class) {
  auto it = std::find_if(weights.begin(), weights.end(),
                         [&](const WeightRanking& entry) { return entry.weight_class == weight_class; });
  if (it != weights.end()) {
    return *it;
  }
  weights.push_back(WeightRanking{weight_class, {}});
  return weights.back();
}
}  // namespace

const std::vector<std::string> kDefaultWeightClasses = {"106", "113", "120", "126", "132", "138", "144",
                                                        "150", "157", "165", "175", "190", "215", "285"};

const WeightRanking* Leaderboard::Find(const std::string& weight_class) const {
  for (const auto& ranking : rankings) {
    if (ranking.weight_class == weight_class) {
      return &ranking;
    }
  }
  return nullptr;
}

double RoundTo(double value, int decimals) {
  const double factor = std::pow(10.0, decimals);
  return std::round(value * factor) / factor;
}

std::unordered_map<std::string, WinLossRecord> TallyRecords(const std::vector<MatchResult>& matches) {
  std::unordered_map<std::string, WinLossRecord> records;
  for (const auto& match : matches) {
    if (!match.IsRated()) {
      continue;
    }
    ++records[*match.winner_id].wins;
    ++records[match.LoserId()].losses;
  }
  return records;
}

std::optional<std::string> PrimaryWeightClass(const WeightUsage& usage, const std::string& athlete_id,
                                              const std::unordered_map<std::string, std::string>& overrides) {
  auto override_it = overrides.find(athlete_id);
  if (override_it != overrides.end()) {
    return override_it->second;
  }
  auto usage_it = usage.find(athlete_id);
  if (usage_it == usage.end()) {
    return std::nullopt;
  }
  return usage_it->second.Primary();
}

std::vector<std::string> RankAthletes(const RatingRunResult& result, std::vector<std::string> candidates) {
  // 엡실론 비교와 상대 전적은 추이적이지 않아 정렬 비교자로 쓸 수 없다.
  // 정확한 레이팅으로 정렬한 뒤, 인접 차이가 엡실론 이하인 구간을 동점 그룹으로 묶어 따로 처리한다.
  std::sort(candidates.begin(), candidates.end(), [&](const std::string& a, const std::string& b) {
    const double ra = result.ratings.at(a).rating;
    const double rb = result.ratings.at(b).rating;
    if (ra != rb) {
      return ra > rb;
    }
    return a < b;
  });

  auto group_begin = candidates.begin();
  while (group_begin != candidates.end()) {
    auto group_end = std::next(group_begin);
    while (group_end != candidates.end() &&
           result.ratings.at(*std::prev(group_end)).rating - result.ratings.at(*group_end).rating <=
               kRatingTieEpsilon) {
      ++group_end;
    }
    // 그룹 안에서는 ID 순서를 기본으로, 상대 전적이 앞서는 선수를 한 칸씩 앞으로 옮긴다.
    std::sort(group_begin, group_end);
    for (auto it = std::next(group_begin, 1); it < group_end; ++it) {
      for (auto cur = it; cur != group_begin; --cur) {
        const auto& a = *cur;
        const auto& b = *std::prev(cur);
        const int net = HeadToHeadCount(result.head_to_head, a, b) - HeadToHeadCount(result.head_to_head, b, a);
        if (net <= 0) {
          break;
        }
        std::iter_swap(cur, std::prev(cur));
      }
    }
    group_begin = group_end;
  }
  return candidates;
}

Leaderboard BuildLeaderboard(const RatingRunResult& result, const LeaderboardRequest& request) {
  Leaderboard board;
  for (const auto& weight_class : request.weight_classes) {
    std::vector<std::string> candidates;
    for (const auto& entry : result.ratings) {
      const auto& athlete_id = entry.first;
      if (request.allowed_ids.count(athlete_id) == 0) {
        continue;
      }
      if (PrimaryWeightClass(result.weight_usage, athlete_id, request.weight_overrides) != weight_class) {
        continue;
      }
      candidates.push_back(athlete_id);
    }
    auto ranked = RankAthletes(result, std::move(candidates));
    if (request.limit && ranked.size() > *request.limit) {
      ranked.resize(*request.limit);
    }

    for (const auto& athlete_id : ranked) {
      if (board.athletes.count(athlete_id) > 0) {
        continue;
      }
      const auto& state = result.ratings.at(athlete_id);
      LeaderboardEntry entry{athlete_id, athlete_id, std::nullopt, std::nullopt, RoundTo(state.rating, 2),
                             RoundTo(state.rd, 2), RoundTo(state.sigma, 4), 0, 0};
      auto profile_it = request.profiles.find(athlete_id);
      if (profile_it != request.profiles.end()) {
        if (!profile_it->second.name.empty()) {
          entry.name = profile_it->second.name;
        }
        entry.team_id = profile_it->second.team_id;
        entry.grad_year = profile_it->second.grad_year;
      }
      auto record_it = request.records.find(athlete_id);
      if (record_it != request.records.end()) {
        entry.wins = record_it->second.wins;
        entry.losses = record_it->second.losses;
      }
      board.athletes.emplace(athlete_id, std::move(entry));
    }
    board.rankings.push_back(WeightRanking{weight_class, std::move(ranked)});
  }
  return board;
}

std::vector<TeamRoster> BuildTeamRosters(const Leaderboard& leaderboard, const std::vector<std::string>& weight_classes,
                                         const std::unordered_map<std::string, TeamMetadata>& team_metadata) {
  std::map<std::string, TeamRoster> teams;
  for (const auto& weight_class : weight_classes) {
    const WeightRanking* ranking = leaderboard.Find(weight_class);
    if (!ranking) {
      continue;
    }
    for (const auto& athlete_id : ranking->athlete_ids) {
      auto athlete_it = leaderboard.athletes.find(athlete_id);
      if (athlete_it == leaderboard.athletes.end() || !athlete_it->second.team_id ||
          athlete_it->second.team_id->empty()) {
        continue;
      }
      const std::string& team_id = *athlete_it->second.team_id;
      auto meta_it = team_metadata.find(team_id);
      const TeamMetadata meta = meta_it == team_metadata.end() ? TeamMetadata{} : meta_it->second;

      auto [team_it, inserted] = teams.try_emplace(team_id);
      TeamRoster& roster = team_it->second;
      if (inserted) {
        roster.id = team_id;
      }
      if ((!roster.name || roster.name->empty()) && meta.name && !meta.name->empty()) {
        roster.name = meta.name;
      }
      if (!roster.division && meta.division) {
        roster.division = meta.division;
      }
      if ((!roster.section || roster.section->empty()) && meta.section && !meta.section->empty()) {
        roster.section = meta.section;
      }
      RankingFor(roster.weights, weight_class).athlete_ids.push_back(athlete_id);
    }
  }

  std::vector<TeamRoster> ordered;
  ordered.reserve(teams.size());
  for (auto& entry : teams) {
    ordered.push_back(std::move(entry.second));
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const TeamRoster& lhs, const TeamRoster& rhs) {
    const std::string lhs_name = Lower(lhs.name);
    const std::string rhs_name = Lower(rhs.name);
    if (lhs_name != rhs_name) {
      return lhs_name < rhs_name;
    }
    return lhs.id < rhs.id;
  });
  return ordered;
}

}  // namespace matrank
