/*
 * 설명: 시즌 분할과 경기 버킷팅을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/rating_period_test.cpp
 */
#include "matrank/rating_period.hpp"

#include <algorithm>

namespace matrank {
namespace {
std::optional<Timestamp> NestedDate(const nlohmann::json& season, const char* section, const char* key) {
  auto section_it = season.find(section);
  if (section_it == season.end() || !section_it->is_object()) {
    return std::nullopt;
  }
  auto value_it = section_it->find(key);
  if (value_it == section_it->end() || !value_it->is_string()) {
    return std::nullopt;
  }
  return ParseTimestamp(value_it->get<std::string>());
}
}  // namespace

std::vector<SeasonRecord> ParseSeasons(const nlohmann::json& doc) {
  const nlohmann::json* entries = &doc;
  if (doc.is_object() && doc.contains("data")) {
    entries = &doc["data"];
  }
  std::vector<SeasonRecord> seasons;
  if (!entries->is_array()) {
    return seasons;
  }
  for (const auto& season : *entries) {
    if (!season.is_object()) {
      continue;
    }
    SeasonRecord record;
    auto name_it = season.find("name");
    record.name = name_it != season.end() && name_it->is_string() ? name_it->get<std::string>() : "unknown";
    record.regular_start = NestedDate(season, "regular", "start_date");
    record.post_end = NestedDate(season, "post", "end_date");
    seasons.push_back(std::move(record));
  }
  return seasons;
}

std::vector<std::pair<Timestamp, Timestamp>> MonthSegments(const Timestamp& start, const Timestamp& end) {
  std::vector<std::pair<Timestamp, Timestamp>> segments;
  Timestamp current = start;
  int step = 1;
  while (current < end) {
    Timestamp next = AddCalendarMonths(start, step++);
    segments.emplace_back(current, std::min(next, end));
    current = next;
  }
  return segments;
}

std::vector<RatingPeriod> BuildPeriods(const std::vector<SeasonRecord>& seasons, const PeriodFilter& filter,
                                       const Timestamp& now) {
  std::vector<RatingPeriod> periods;
  for (const auto& season : seasons) {
    if (filter.seasons && filter.seasons->count(season.name) == 0) {
      continue;
    }
    if (!season.regular_start || !season.post_end) {
      continue;
    }

    Timestamp season_start = *season.regular_start;
    // 종료일은 포함이므로 하루를 더해 반개구간으로 만든다.
    Timestamp season_end = *season.post_end + boost::gregorian::days(1);
    if (filter.start_override) {
      season_start = std::max(season_start, *filter.start_override);
    }
    if (filter.end_override) {
      season_end = std::min(season_end, *filter.end_override);
    }
    season_end = std::min(season_end, now);
    if (season_start >= season_end) {
      continue;
    }

    for (const auto& [start, end] : MonthSegments(season_start, season_end)) {
      periods.push_back(RatingPeriod{start, end, season.name});
    }
  }
  return periods;
}

std::vector<MatchBucket> BucketMatches(const std::vector<RatingPeriod>& periods, std::vector<MatchResult> matches) {
  std::vector<MatchBucket> buckets(periods.size());
  if (periods.empty()) {
    return buckets;
  }
  std::stable_sort(matches.begin(), matches.end(),
                   [](const MatchResult& lhs, const MatchResult& rhs) { return lhs.date < rhs.date; });

  std::size_t period_idx = 0;
  for (auto& match : matches) {
    while (period_idx < periods.size() && match.date >= periods[period_idx].end) {
      ++period_idx;
    }
    if (period_idx >= periods.size()) {
      break;
    }
    if (match.date >= periods[period_idx].start) {
      buckets[period_idx].push_back(std::move(match));
    }
  }
  return buckets;
}

}  // namespace matrank
