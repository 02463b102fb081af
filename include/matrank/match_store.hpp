/*
 * 설명: MariaDB에 저장된 경기/선수/팀 데이터를 레이팅 입력으로 읽어 온다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, sql/schema.sql
 * 테스트: tests/it/match_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "matrank/calendar.hpp"
#include "matrank/db_client.hpp"
#include "matrank/match.hpp"
#include "matrank/observability.hpp"
#include "matrank/roster.hpp"

namespace matrank {

class MatchStore {
 public:
  MatchStore(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability);

  // 승리 기록이 min_wins 이상인 선수 ID.
  std::set<std::string> ActiveAthletes(int min_wins) const;

  // 유효 날짜(경기 날짜, 없으면 대회 날짜)가 [start, end)에 들고 두 선수가 모두 roster에 있는 경기.
  // 날짜 → ID 오름차순으로 정렬해 돌려준다. 날짜나 선수 ID가 없는 레코드는 건너뛴다.
  std::vector<MatchResult> MatchesBetween(const Timestamp& start, const Timestamp& end,
                                          const std::set<std::string>& roster,
                                          const std::optional<std::set<std::string>>& weight_filter) const;

  AthleteInfoMap FetchAthleteInfo(const std::set<std::string>& athlete_ids) const;
  TeamMetadataMap FetchTeamInfo(const std::set<std::string>& team_ids) const;

 private:
  std::string InList(MYSQL* conn, std::vector<std::string>::const_iterator begin,
                     std::vector<std::string>::const_iterator end) const;
  void SkipRecord(const std::string& match_id, const std::string& reason) const;

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace matrank
