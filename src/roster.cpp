/*
 * 설명: 자격 필터와 선수/팀 표시 정보 병합을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/roster_test.cpp
 */
#include "matrank/roster.hpp"

namespace matrank {
namespace {
std::optional<int> EffectiveGradYear(const std::string& athlete_id, const AthleteInfoMap& info,
                                     const AthleteOverrides& overrides) {
  auto override_it = overrides.grad_years.find(athlete_id);
  if (override_it != overrides.grad_years.end()) {
    return override_it->second;
  }
  auto info_it = info.find(athlete_id);
  return info_it == info.end() ? std::nullopt : info_it->second.grad_year;
}

bool NonEmpty(const std::optional<std::string>& value) { return value && !value->empty(); }
}  // namespace

std::set<std::string> SelectEligibleAthletes(const std::set<std::string>& rated_ids, const AthleteInfoMap& info,
                                             const AthleteOverrides& overrides, std::optional<int> grad_year_filter,
                                             int current_school_year) {
  std::set<std::string> eligible;
  for (const auto& entry : info) {
    const auto& athlete_id = entry.first;
    if (overrides.exclude.count(athlete_id) > 0) {
      continue;
    }
    const auto grad_year = EffectiveGradYear(athlete_id, info, overrides);
    if (grad_year_filter) {
      if (grad_year && *grad_year == *grad_year_filter && *grad_year > current_school_year) {
        eligible.insert(athlete_id);
      }
    } else if (!grad_year || *grad_year > current_school_year) {
      eligible.insert(athlete_id);
    }
  }

  if (!grad_year_filter) {
    for (const auto& athlete_id : rated_ids) {
      if (overrides.exclude.count(athlete_id) > 0 || info.count(athlete_id) > 0) {
        continue;
      }
      const auto grad_year = EffectiveGradYear(athlete_id, info, overrides);
      if (grad_year && *grad_year <= current_school_year) {
        continue;
      }
      eligible.insert(athlete_id);
    }
  }
  return eligible;
}

RosterContext BuildRosterContext(const AthleteInfoMap& info, const std::set<std::string>& eligible,
                                 const AthleteOverrides& overrides, const TeamMetadataMap& override_team_meta) {
  RosterContext context;
  // 선수별 소속 팀 표시 정보. 팀 오버라이드가 있으면 해당 팀 정보로 대체한다.
  std::unordered_map<std::string, TeamMetadata> athlete_team;

  for (const auto& [athlete_id, athlete] : info) {
    AthleteProfile profile;
    profile.name = athlete.name.empty() ? athlete_id : athlete.name;
    profile.team_id = athlete.team_id;
    profile.grad_year = athlete.grad_year;
    context.profiles[athlete_id] = profile;
    athlete_team[athlete_id] = TeamMetadata{athlete.team_name, athlete.section, athlete.division};
  }

  for (const auto& [athlete_id, grad_year] : overrides.grad_years) {
    auto& profile = context.profiles[athlete_id];
    if (profile.name.empty()) {
      profile.name = athlete_id;
    }
    profile.grad_year = grad_year;
  }

  for (const auto& [athlete_id, team_id] : overrides.teams) {
    auto& profile = context.profiles[athlete_id];
    if (profile.name.empty()) {
      profile.name = athlete_id;
    }
    profile.team_id = team_id;

    auto& team = athlete_team[athlete_id];
    auto meta_it = override_team_meta.find(team_id);
    if (meta_it != override_team_meta.end()) {
      team.name = NonEmpty(meta_it->second.name) ? meta_it->second.name : std::optional<std::string>(team_id);
      if (meta_it->second.section) {
        team.section = meta_it->second.section;
      }
      if (meta_it->second.division) {
        team.division = meta_it->second.division;
      }
    } else {
      team.name = team_id;
    }
  }

  for (const auto& entry : athlete_team) {
    if (NonEmpty(entry.second.section)) {
      context.sections.insert(*entry.second.section);
    }
    if (entry.second.division) {
      context.divisions.insert(*entry.second.division);
    }
  }

  context.teams = override_team_meta;
  for (const auto& athlete_id : eligible) {
    auto profile_it = context.profiles.find(athlete_id);
    if (profile_it == context.profiles.end() || !NonEmpty(profile_it->second.team_id)) {
      continue;
    }
    auto& team = context.teams[*profile_it->second.team_id];
    auto source_it = athlete_team.find(athlete_id);
    if (source_it == athlete_team.end()) {
      continue;
    }
    const auto& source = source_it->second;
    if (!NonEmpty(team.name) && NonEmpty(source.name)) {
      team.name = source.name;
    }
    if (!NonEmpty(team.section) && NonEmpty(source.section)) {
      team.section = source.section;
    }
    if (!team.division && source.division) {
      team.division = source.division;
    }
  }
  return context;
}

}  // namespace matrank
