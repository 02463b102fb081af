/*
 * 설명: 경기/선수/팀 조회 쿼리와 행 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/schema.sql
 * 테스트: tests/it/match_store_it_test.cpp
 */
#include "matrank/match_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include <boost/date_time/gregorian/gregorian.hpp>

namespace matrank {
namespace {
constexpr std::size_t kInListChunk = 500;

std::optional<std::string> ToOptional(const char* value, unsigned long length) {
  if (!value) {
    return std::nullopt;
  }
  return std::string(value, length);
}

std::optional<int> ToOptionalInt(const char* value) {
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  char* end = nullptr;
  long parsed = std::strtol(value, &end, 10);
  if (end == value || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<int>(parsed);
}

// 저장된 날짜 문자열은 UTC 오프셋을 가질 수 있어 문자열 비교가 최대 하루 어긋난다.
// 양쪽 경계를 하루씩 넓혀 후보를 가져오고 정확한 [start, end) 판정은 파싱 후에 한다.
std::string SqlDate(const Timestamp& ts, bool upper) {
  auto day = ts.date();
  if (upper) {
    day += boost::gregorian::days(ts.time_of_day() == boost::posix_time::time_duration(0, 0, 0) ? 1 : 2);
  } else {
    day -= boost::gregorian::days(1);
  }
  return boost::gregorian::to_iso_extended_string(day);
}
}  // namespace

MatchStore::MatchStore(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)), observability_(std::move(observability)) {}

std::string MatchStore::InList(MYSQL* conn, std::vector<std::string>::const_iterator begin,
                               std::vector<std::string>::const_iterator end) const {
  std::ostringstream oss;
  oss << "(";
  for (auto it = begin; it != end; ++it) {
    if (it != begin) {
      oss << ", ";
    }
    oss << "'" << db_client_->Escape(conn, *it) << "'";
  }
  oss << ")";
  return oss.str();
}

void MatchStore::SkipRecord(const std::string& match_id, const std::string& reason) const {
  if (!observability_) {
    return;
  }
  observability_->AddSkipped();
  observability_->Log(LogLevel::kWarn, "match_skipped", {{"matchId", match_id}, {"reason", reason}});
}

std::set<std::string> MatchStore::ActiveAthletes(int min_wins) const {
  std::set<std::string> ids;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    ids.clear();
    std::ostringstream oss;
    oss << "SELECT winnerId FROM matches WHERE winnerId IS NOT NULL AND winnerId <> '' "
        << "GROUP BY winnerId HAVING COUNT(*) >= " << std::max(min_wins, 0) << ";";
    db_client_->Query(conn, oss.str(), "활성 선수 조회", [&](MYSQL_ROW row, unsigned long* lengths) {
      if (row[0]) {
        ids.emplace(row[0], lengths[0]);
      }
    });
  });
  return ids;
}

std::vector<MatchResult> MatchStore::MatchesBetween(const Timestamp& start, const Timestamp& end,
                                                    const std::set<std::string>& roster,
                                                    const std::optional<std::set<std::string>>& weight_filter) const {
  std::vector<MatchResult> matches;
  if (end <= start || (weight_filter && weight_filter->empty())) {
    return matches;
  }
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    matches.clear();
    std::ostringstream oss;
    oss << "SELECT m.id, m.topId, m.bottomId, m.winnerId, m.winType, m.weightClass, COALESCE(m.date, e.date) "
        << "FROM matches m LEFT JOIN events e ON e.id = m.eventId "
        << "WHERE COALESCE(m.date, e.date) >= '" << SqlDate(start, false) << "' "
        << "AND COALESCE(m.date, e.date) < '" << SqlDate(end, true) << "'";
    if (weight_filter) {
      std::vector<std::string> classes(weight_filter->begin(), weight_filter->end());
      oss << " AND m.weightClass IN " << InList(conn, classes.begin(), classes.end());
    }
    oss << ";";

    db_client_->Query(conn, oss.str(), "경기 조회", [&](MYSQL_ROW row, unsigned long* lengths) {
      const std::string match_id = row[0] ? std::string(row[0], lengths[0]) : "";
      auto top_id = ToOptional(row[1], lengths[1]);
      auto bottom_id = ToOptional(row[2], lengths[2]);
      if (!top_id || top_id->empty() || !bottom_id || bottom_id->empty()) {
        SkipRecord(match_id, "선수 ID 없음");
        return;
      }
      auto date_text = ToOptional(row[6], lengths[6]);
      std::optional<Timestamp> date = date_text ? ParseTimestamp(*date_text) : std::nullopt;
      if (!date) {
        SkipRecord(match_id, "날짜 파싱 실패");
        return;
      }
      if (*date < start || *date >= end) {
        return;
      }
      if (roster.count(*top_id) == 0 || roster.count(*bottom_id) == 0) {
        return;
      }

      MatchResult match;
      match.id = match_id;
      match.date = *date;
      match.top_id = *top_id;
      match.bottom_id = *bottom_id;
      auto winner = ToOptional(row[3], lengths[3]);
      if (winner && !winner->empty()) {
        match.winner_id = *winner;
      }
      match.win_type = ToOptional(row[4], lengths[4]);
      match.weight_class = ToOptional(row[5], lengths[5]);
      matches.push_back(std::move(match));
    });
  });

  std::sort(matches.begin(), matches.end(), [](const MatchResult& lhs, const MatchResult& rhs) {
    if (lhs.date != rhs.date) {
      return lhs.date < rhs.date;
    }
    return lhs.id < rhs.id;
  });
  if (observability_) {
    observability_->AddMatches(matches.size());
  }
  return matches;
}

AthleteInfoMap MatchStore::FetchAthleteInfo(const std::set<std::string>& athlete_ids) const {
  AthleteInfoMap info;
  if (athlete_ids.empty()) {
    return info;
  }
  const std::vector<std::string> ids(athlete_ids.begin(), athlete_ids.end());
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    info.clear();
    for (std::size_t offset = 0; offset < ids.size(); offset += kInListChunk) {
      auto chunk_end = ids.begin() + static_cast<std::ptrdiff_t>(std::min(ids.size(), offset + kInListChunk));
      std::ostringstream oss;
      oss << "SELECT w.id, w.name, w.teamId, t.name, t.section, t.division, w.gradYear "
          << "FROM wrestlers w LEFT JOIN teams t ON t.id = w.teamId WHERE w.id IN "
          << InList(conn, ids.begin() + static_cast<std::ptrdiff_t>(offset), chunk_end) << ";";
      db_client_->Query(conn, oss.str(), "선수 정보 조회", [&](MYSQL_ROW row, unsigned long* lengths) {
        if (!row[0]) {
          return;
        }
        AthleteInfo athlete;
        athlete.name = ToOptional(row[1], lengths[1]).value_or("");
        athlete.team_id = ToOptional(row[2], lengths[2]);
        athlete.team_name = ToOptional(row[3], lengths[3]);
        athlete.section = ToOptional(row[4], lengths[4]);
        athlete.division = ToOptionalInt(row[5]);
        athlete.grad_year = ToOptionalInt(row[6]);
        info[std::string(row[0], lengths[0])] = std::move(athlete);
      });
    }
  });
  return info;
}

TeamMetadataMap MatchStore::FetchTeamInfo(const std::set<std::string>& team_ids) const {
  TeamMetadataMap teams;
  if (team_ids.empty()) {
    return teams;
  }
  const std::vector<std::string> ids(team_ids.begin(), team_ids.end());
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    teams.clear();
    for (std::size_t offset = 0; offset < ids.size(); offset += kInListChunk) {
      auto chunk_end = ids.begin() + static_cast<std::ptrdiff_t>(std::min(ids.size(), offset + kInListChunk));
      std::ostringstream oss;
      oss << "SELECT id, name, section, division FROM teams WHERE id IN "
          << InList(conn, ids.begin() + static_cast<std::ptrdiff_t>(offset), chunk_end) << ";";
      db_client_->Query(conn, oss.str(), "팀 정보 조회", [&](MYSQL_ROW row, unsigned long* lengths) {
        if (!row[0]) {
          return;
        }
        teams[std::string(row[0], lengths[0])] =
            TeamMetadata{ToOptional(row[1], lengths[1]), ToOptional(row[2], lengths[2]), ToOptionalInt(row[3])};
      });
    }
  });
  return teams;
}

}  // namespace matrank
