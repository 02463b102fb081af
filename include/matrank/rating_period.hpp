/*
 * 설명: 시즌 경계를 월 단위 레이팅 기간으로 분할하고 경기를 기간별로 배정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/rating_period_test.cpp
 */
#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "matrank/calendar.hpp"
#include "matrank/match.hpp"

namespace matrank {

struct SeasonRecord {
  std::string name;
  std::optional<Timestamp> regular_start;
  std::optional<Timestamp> post_end;
};

struct RatingPeriod {
  Timestamp start;
  Timestamp end;  // 미포함
  std::string season;
};

struct PeriodFilter {
  std::optional<std::set<std::string>> seasons;
  std::optional<Timestamp> start_override;
  std::optional<Timestamp> end_override;  // 미포함
};

using MatchBucket = std::vector<MatchResult>;

// {"name", "regular": {"start_date"}, "post": {"end_date"}} 배열 또는 {"data": [...]} 객체를 읽는다.
// 날짜가 없거나 해석할 수 없으면 해당 경계는 비워 둔다.
std::vector<SeasonRecord> ParseSeasons(const nlohmann::json& doc);

std::vector<RatingPeriod> BuildPeriods(const std::vector<SeasonRecord>& seasons, const PeriodFilter& filter,
                                       const Timestamp& now);

// [start, end)를 달력 월 단위로 자른다. 마지막 구간은 end에서 잘린다.
std::vector<std::pair<Timestamp, Timestamp>> MonthSegments(const Timestamp& start, const Timestamp& end);

// 날짜 오름차순 입력을 가정하지만 안정 정렬로 한 번 더 정렬한 뒤 단일 전진 스윕으로 배정한다.
std::vector<MatchBucket> BucketMatches(const std::vector<RatingPeriod>& periods, std::vector<MatchResult> matches);

}  // namespace matrank
