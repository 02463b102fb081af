#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "matrank/rating_period.hpp"

namespace {

matrank::Timestamp Date(int year, int month, int day) {
  return matrank::Timestamp(boost::gregorian::date(static_cast<unsigned short>(year),
                                                   static_cast<unsigned short>(month),
                                                   static_cast<unsigned short>(day)));
}

nlohmann::json Season(const std::string& name, const std::string& start, const std::string& end) {
  return {{"name", name}, {"regular", {{"start_date", start}}}, {"post", {{"end_date", end}}}};
}

matrank::MatchResult MatchOn(const std::string& id, const matrank::Timestamp& date) {
  return matrank::MatchResult{id, date, "top", "bottom", std::string("top"), std::string("DEC"), std::string("120")};
}

}  // namespace

TEST(SeasonParseTest, AcceptsArrayOrDataEnvelope) {
  auto plain = matrank::ParseSeasons(nlohmann::json::array({Season("2022-2023", "2022-11-01", "2023-02-15")}));
  ASSERT_EQ(plain.size(), 1u);
  EXPECT_EQ(plain[0].name, "2022-2023");
  ASSERT_TRUE(plain[0].regular_start.has_value());
  ASSERT_TRUE(plain[0].post_end.has_value());
  EXPECT_EQ(*plain[0].regular_start, Date(2022, 11, 1));
  EXPECT_EQ(*plain[0].post_end, Date(2023, 2, 15));

  nlohmann::json envelope{{"data", nlohmann::json::array({Season("2023-2024", "2023-11-01", "2024-02-15")})}};
  auto wrapped = matrank::ParseSeasons(envelope);
  ASSERT_EQ(wrapped.size(), 1u);
  EXPECT_EQ(wrapped[0].name, "2023-2024");
}

TEST(SeasonParseTest, KeepsRecordsWithMissingBoundaries) {
  nlohmann::json doc = nlohmann::json::array({{{"regular", {{"start_date", "bad"}}}}, 42});
  auto seasons = matrank::ParseSeasons(doc);
  ASSERT_EQ(seasons.size(), 1u);
  EXPECT_EQ(seasons[0].name, "unknown");
  EXPECT_FALSE(seasons[0].regular_start.has_value());
  EXPECT_FALSE(seasons[0].post_end.has_value());
}

TEST(TimePartitionerTest, SplitsSeasonIntoCalendarMonths) {
  auto seasons = matrank::ParseSeasons(nlohmann::json::array({Season("2022-2023", "2022-11-01", "2023-02-15")}));
  auto periods = matrank::BuildPeriods(seasons, matrank::PeriodFilter{}, Date(2024, 1, 1));

  ASSERT_EQ(periods.size(), 4u);
  EXPECT_EQ(periods[0].start, Date(2022, 11, 1));
  EXPECT_EQ(periods[0].end, Date(2022, 12, 1));
  EXPECT_EQ(periods[1].start, Date(2022, 12, 1));
  EXPECT_EQ(periods[1].end, Date(2023, 1, 1));
  EXPECT_EQ(periods[2].start, Date(2023, 1, 1));
  EXPECT_EQ(periods[2].end, Date(2023, 2, 1));
  EXPECT_EQ(periods[3].start, Date(2023, 2, 1));
  EXPECT_EQ(periods[3].end, Date(2023, 2, 16));
  for (const auto& period : periods) {
    EXPECT_EQ(period.season, "2022-2023");
  }
}

TEST(TimePartitionerTest, AnchorsSegmentsToSeasonStartDay) {
  auto seasons = matrank::ParseSeasons(nlohmann::json::array({Season("late", "2023-01-31", "2023-04-15")}));
  auto periods = matrank::BuildPeriods(seasons, matrank::PeriodFilter{}, Date(2024, 1, 1));

  ASSERT_EQ(periods.size(), 3u);
  EXPECT_EQ(periods[0].end, Date(2023, 2, 28));
  EXPECT_EQ(periods[1].start, Date(2023, 2, 28));
  EXPECT_EQ(periods[1].end, Date(2023, 3, 31));
  EXPECT_EQ(periods[2].end, Date(2023, 4, 16));
}

TEST(TimePartitionerTest, SkipsFutureAndIncompleteSeasons) {
  nlohmann::json doc = nlohmann::json::array({Season("future", "2030-11-01", "2031-02-15"),
                                              {{"name", "broken"}, {"regular", {{"start_date", "2022-11-01"}}}}});
  auto periods = matrank::BuildPeriods(matrank::ParseSeasons(doc), matrank::PeriodFilter{}, Date(2024, 1, 1));
  EXPECT_TRUE(periods.empty());
}

TEST(TimePartitionerTest, ClipsToNowAndOverrides) {
  auto seasons = matrank::ParseSeasons(nlohmann::json::array(
      {Season("2022-2023", "2022-11-01", "2023-02-15"), Season("2023-2024", "2023-11-01", "2024-02-15")}));

  auto in_progress = matrank::BuildPeriods(seasons, matrank::PeriodFilter{}, Date(2023, 12, 10));
  ASSERT_EQ(in_progress.size(), 6u);
  EXPECT_EQ(in_progress.back().season, "2023-2024");
  EXPECT_EQ(in_progress.back().end, Date(2023, 12, 10));

  matrank::PeriodFilter filter;
  filter.seasons = std::set<std::string>{"2022-2023"};
  filter.start_override = Date(2022, 12, 15);
  filter.end_override = Date(2023, 1, 20);
  auto clipped = matrank::BuildPeriods(seasons, filter, Date(2024, 6, 1));
  ASSERT_EQ(clipped.size(), 2u);
  EXPECT_EQ(clipped[0].start, Date(2022, 12, 15));
  EXPECT_EQ(clipped[0].end, Date(2023, 1, 15));
  EXPECT_EQ(clipped[1].start, Date(2023, 1, 15));
  EXPECT_EQ(clipped[1].end, Date(2023, 1, 20));
}

TEST(MatchBucketerTest, DropsMatchesInGapsAndOutsideRange) {
  std::vector<matrank::RatingPeriod> periods{{Date(2022, 11, 1), Date(2022, 12, 1), "s"},
                                             {Date(2023, 1, 1), Date(2023, 2, 1), "s"}};
  std::vector<matrank::MatchResult> matches{MatchOn("after", Date(2023, 3, 1)), MatchOn("jan", Date(2023, 1, 10)),
                                            MatchOn("gap", Date(2022, 12, 15)), MatchOn("nov", Date(2022, 11, 5)),
                                            MatchOn("before", Date(2022, 10, 15))};

  auto buckets = matrank::BucketMatches(periods, matches);
  ASSERT_EQ(buckets.size(), 2u);
  ASSERT_EQ(buckets[0].size(), 1u);
  EXPECT_EQ(buckets[0][0].id, "nov");
  ASSERT_EQ(buckets[1].size(), 1u);
  EXPECT_EQ(buckets[1][0].id, "jan");
}

TEST(MatchBucketerTest, KeepsFeedOrderWithinSameTimestamp) {
  std::vector<matrank::RatingPeriod> periods{{Date(2022, 11, 1), Date(2022, 12, 1), "s"}};
  std::vector<matrank::MatchResult> matches{MatchOn("b", Date(2022, 11, 5)), MatchOn("a", Date(2022, 11, 5)),
                                            MatchOn("start", Date(2022, 11, 1)), MatchOn("end", Date(2022, 12, 1))};

  auto buckets = matrank::BucketMatches(periods, matches);
  ASSERT_EQ(buckets.size(), 1u);
  ASSERT_EQ(buckets[0].size(), 3u);
  EXPECT_EQ(buckets[0][0].id, "start");
  EXPECT_EQ(buckets[0][1].id, "b");
  EXPECT_EQ(buckets[0][2].id, "a");
}

TEST(MatchBucketerTest, ReturnsEmptyBucketsWithoutMatches) {
  std::vector<matrank::RatingPeriod> periods{{Date(2022, 11, 1), Date(2022, 12, 1), "s"},
                                             {Date(2022, 12, 1), Date(2023, 1, 1), "s"}};
  auto buckets = matrank::BucketMatches(periods, {});
  ASSERT_EQ(buckets.size(), 2u);
  EXPECT_TRUE(buckets[0].empty());
  EXPECT_TRUE(buckets[1].empty());
}
