/*
 * 설명: 리더보드 JSON 페이로드 생성과 파일/텍스트 출력을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/report_test.cpp
 */
#include "matrank/report.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace matrank {
namespace {
template <typename T>
nlohmann::json OptionalJson(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename Map>
nlohmann::json MapOrNull(const Map& values) {
  if (values.empty()) {
    return nullptr;
  }
  nlohmann::json out = nlohmann::json::object();
  for (const auto& entry : values) {
    out[entry.first] = entry.second;
  }
  return out;
}

nlohmann::json OverridesJson(const AthleteOverrides& overrides) {
  nlohmann::json out;
  out["weights"] = MapOrNull(overrides.weights);
  out["exclude"] = overrides.exclude.empty() ? nlohmann::json(nullptr) : nlohmann::json(overrides.exclude);
  out["gradYears"] = MapOrNull(overrides.grad_years);
  out["teams"] = MapOrNull(overrides.teams);
  return out;
}

nlohmann::json EntryJson(const LeaderboardEntry& entry) {
  return nlohmann::json{{"id", entry.id},
                        {"name", entry.name},
                        {"teamId", OptionalJson(entry.team_id)},
                        {"gradYear", OptionalJson(entry.grad_year)},
                        {"rating", entry.rating},
                        {"rd", entry.rd},
                        {"sigma", entry.sigma},
                        {"wins", entry.wins},
                        {"losses", entry.losses}};
}

nlohmann::json TeamJson(const TeamRoster& team) {
  nlohmann::json weights = nlohmann::json::object();
  for (const auto& ranking : team.weights) {
    weights[ranking.weight_class] = ranking.athlete_ids;
  }
  return nlohmann::json{{"id", team.id},
                        {"name", OptionalJson(team.name)},
                        {"division", OptionalJson(team.division)},
                        {"section", OptionalJson(team.section)},
                        {"weights", weights}};
}
}  // namespace

nlohmann::json BuildReportPayload(const ReportSummary& summary, const AthleteOverrides& overrides,
                                  const RosterContext& roster, const Leaderboard& leaderboard,
                                  const std::vector<TeamRoster>& teams) {
  std::vector<const LeaderboardEntry*> entries;
  entries.reserve(leaderboard.athletes.size());
  for (const auto& entry : leaderboard.athletes) {
    entries.push_back(&entry.second);
  }
  std::sort(entries.begin(), entries.end(), [](const LeaderboardEntry* lhs, const LeaderboardEntry* rhs) {
    if (lhs->rating != rhs->rating) {
      return lhs->rating > rhs->rating;
    }
    if (lhs->name != rhs->name) {
      return lhs->name < rhs->name;
    }
    return lhs->id < rhs->id;
  });

  nlohmann::json wrestlers = nlohmann::json::array();
  for (const auto* entry : entries) {
    wrestlers.push_back(EntryJson(*entry));
  }

  nlohmann::json weights = nlohmann::json::object();
  for (const auto& ranking : leaderboard.rankings) {
    weights[ranking.weight_class] = ranking.athlete_ids;
  }

  nlohmann::json teams_json = nlohmann::json::array();
  for (const auto& team : teams) {
    teams_json.push_back(TeamJson(team));
  }

  nlohmann::json payload;
  payload["tau"] = summary.tau;
  payload["matches"] = summary.matches;
  payload["periods"] = summary.periods;
  payload["gradYear"] = OptionalJson(summary.grad_year);
  payload["overrides"] = OverridesJson(overrides);
  payload["sectionDivisionData"] = {{"sections", roster.sections}, {"divisions", roster.divisions}};
  payload["teams"] = teams_json;
  payload["weights"] = weights;
  payload["wrestlers"] = wrestlers;
  return payload;
}

void WriteReportFile(const std::string& path, const nlohmann::json& payload) {
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }
  std::ofstream out(target);
  if (!out) {
    throw std::runtime_error("리더보드 JSON 파일을 열 수 없음: " + path);
  }
  out << payload.dump(2);
  if (!out) {
    throw std::runtime_error("리더보드 JSON 파일 쓰기 실패: " + path);
  }
}

void WriteTextReport(std::ostream& out, const ReportSummary& summary, const Leaderboard& leaderboard) {
  out << "Processed " << summary.matches << " matches across " << summary.periods << " monthly periods.\n";
  for (const auto& ranking : leaderboard.rankings) {
    if (ranking.athlete_ids.empty()) {
      continue;
    }
    out << "\nWeight " << ranking.weight_class << "\n";
    int index = 0;
    for (const auto& athlete_id : ranking.athlete_ids) {
      ++index;
      auto it = leaderboard.athletes.find(athlete_id);
      if (it == leaderboard.athletes.end()) {
        continue;
      }
      const auto& entry = it->second;
      out << std::setw(2) << index << ". " << entry.name << " (" << entry.id << ") - R: " << entry.rating
          << " RD: " << entry.rd << " sigma: " << entry.sigma << "\n";
    }
  }
}

}  // namespace matrank
