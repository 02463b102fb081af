#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "matrank/rating_run.hpp"

namespace {

matrank::Timestamp Date(int year, int month, int day) {
  return matrank::Timestamp(boost::gregorian::date(static_cast<unsigned short>(year),
                                                   static_cast<unsigned short>(month),
                                                   static_cast<unsigned short>(day)));
}

struct Fixture {
  std::vector<matrank::RatingPeriod> periods;
  std::vector<matrank::MatchBucket> buckets;
  std::set<std::string> roster;
};

// 네 명이 세 달 동안 치른 고정 경기 세트. 강한 순서는 A > B > C > D 이지만 이변도 섞여 있다.
Fixture BuildFixture() {
  Fixture fixture;
  fixture.periods = {{Date(2022, 11, 1), Date(2022, 12, 1), "2022-2023"},
                     {Date(2022, 12, 1), Date(2023, 1, 1), "2022-2023"},
                     {Date(2023, 1, 1), Date(2023, 2, 1), "2022-2023"}};
  fixture.roster = {"A", "B", "C", "D", "ghost"};

  const std::vector<std::vector<std::string>> schedule{
      {"A", "B", "A", "F"},  {"C", "D", "C", "DEC"}, {"A", "C", "A", "MD"}, {"B", "D", "B", "TF"},
      {"A", "D", "A", "F"},  {"B", "C", "C", "DEC"}, {"A", "B", "B", "DEC"}, {"C", "D", "D", "DEC"},
      {"A", "C", "A", "TF"}, {"B", "D", "B", "MD"},  {"A", "B", "A", "DEC"}, {"C", "D", "C", "F"}};
  std::vector<matrank::MatchResult> matches;
  for (std::size_t i = 0; i < schedule.size(); ++i) {
    const auto& bout = schedule[i];
    const int month_index = static_cast<int>(i / 4);
    const auto date = month_index == 0 ? Date(2022, 11, 5 + static_cast<int>(i))
                                       : month_index == 1 ? Date(2022, 12, 5 + static_cast<int>(i))
                                                          : Date(2023, 1, 5 + static_cast<int>(i));
    matches.push_back(matrank::MatchResult{"m" + std::to_string(i), date, bout[0], bout[1], bout[2], bout[3],
                                           std::string(i % 2 == 0 ? "120" : "126")});
  }
  fixture.buckets = matrank::BucketMatches(fixture.periods, matches);
  return fixture;
}

}  // namespace

TEST(RatingRunTest, NeverSeenAthleteKeepsDefaultRating) {
  auto fixture = BuildFixture();
  // 두 번째 시즌과 공백을 추가해 RD 확장/시즌 리셋 경로를 모두 거치게 한다.
  fixture.periods.push_back({Date(2023, 11, 1), Date(2023, 12, 1), "2023-2024"});
  fixture.buckets.emplace_back();

  auto result = matrank::RunSimulation(fixture.periods, fixture.buckets, fixture.roster, matrank::SimulationOptions{});

  const auto& ghost = result.ratings.at("ghost");
  EXPECT_DOUBLE_EQ(ghost.rating, matrank::kDefaultRating);
  EXPECT_DOUBLE_EQ(ghost.rd, matrank::kDefaultRd);
  EXPECT_DOUBLE_EQ(ghost.sigma, matrank::kDefaultSigma);
  EXPECT_EQ(result.weight_usage.count("ghost"), 0u);
}

TEST(RatingRunTest, ProducesOnePredictionPerRatedMatch) {
  auto fixture = BuildFixture();
  auto result = matrank::RunSimulation(fixture.periods, fixture.buckets, fixture.roster, matrank::SimulationOptions{});

  EXPECT_EQ(result.predictions.size(), 12u);
  EXPECT_GT(result.ratings.at("A").rating, result.ratings.at("D").rating);
  EXPECT_EQ((result.head_to_head[{"A", "B"}]), 2);
  EXPECT_EQ((result.head_to_head[{"B", "A"}]), 1);
}

TEST(RatingRunTest, SeasonChangeRaisesRdToFloor) {
  auto fixture = BuildFixture();
  matrank::SimulationOptions with_reset;
  with_reset.engine.season_rd_floor = 340.0;
  matrank::SimulationOptions without_reset = with_reset;
  without_reset.reset_rd_on_new_season = false;

  // 마지막 기간만 다음 시즌으로 표시하고 공백 없이 이어 붙인다.
  fixture.periods.back().season = "2023-2024";

  auto reset = matrank::RunSimulation(fixture.periods, fixture.buckets, fixture.roster, with_reset);
  auto plain = matrank::RunSimulation(fixture.periods, fixture.buckets, fixture.roster, without_reset);

  // 시즌 리셋이 있으면 새 시즌 첫 기간의 불확실성이 커서 결과가 달라진다.
  EXPECT_NE(reset.ratings.at("A").rating, plain.ratings.at("A").rating);
  EXPECT_EQ(reset.predictions.size(), plain.predictions.size());
}

TEST(RatingRunTest, EvaluatesBrierAndAccuracy) {
  auto score = matrank::EvaluatePredictions({{0.8, 1.0}, {0.4, 0.0}, {0.5, 0.0}});
  EXPECT_NEAR(score.brier, 0.15, 1e-12);
  EXPECT_NEAR(score.accuracy, 2.0 / 3.0, 1e-12);

  auto empty = matrank::EvaluatePredictions({});
  EXPECT_DOUBLE_EQ(empty.brier, 0.0);
  EXPECT_DOUBLE_EQ(empty.accuracy, 0.0);
}

TEST(TauCalibrationTest, RepeatedSearchesAreDeterministic) {
  const auto fixture = BuildFixture();
  const std::vector<double> candidates{0.1, 0.3, 0.5};

  auto first = matrank::TuneTau(fixture.periods, fixture.buckets, fixture.roster, candidates,
                                matrank::SimulationOptions{}, 3);
  auto second = matrank::TuneTau(fixture.periods, fixture.buckets, fixture.roster, candidates,
                                 matrank::SimulationOptions{}, 3);
  auto serial = matrank::TuneTau(fixture.periods, fixture.buckets, fixture.roster, candidates,
                                 matrank::SimulationOptions{}, 1);

  EXPECT_DOUBLE_EQ(first.tau, second.tau);
  EXPECT_DOUBLE_EQ(first.score.brier, second.score.brier);
  EXPECT_DOUBLE_EQ(first.score.accuracy, second.score.accuracy);
  EXPECT_DOUBLE_EQ(first.tau, serial.tau);
  EXPECT_DOUBLE_EQ(first.score.brier, serial.score.brier);
}

TEST(TauCalibrationTest, SelectsLowestBrierCandidate) {
  const auto fixture = BuildFixture();
  const std::vector<double> candidates{0.1, 0.3, 0.5};

  auto selection = matrank::TuneTau(fixture.periods, fixture.buckets, fixture.roster, candidates,
                                    matrank::SimulationOptions{}, 2);

  double best_brier = 0.0;
  bool first = true;
  for (double tau : candidates) {
    matrank::SimulationOptions options;
    options.engine.tau = tau;
    auto run = matrank::RunSimulation(fixture.periods, fixture.buckets, fixture.roster, options);
    auto score = matrank::EvaluatePredictions(run.predictions);
    if (first || score.brier < best_brier) {
      best_brier = score.brier;
      first = false;
    }
  }
  EXPECT_DOUBLE_EQ(selection.score.brier, best_brier);
}

TEST(TauCalibrationTest, KeepsFirstCandidateOnTie) {
  const auto fixture = BuildFixture();
  auto selection = matrank::TuneTau(fixture.periods, fixture.buckets, fixture.roster, {0.3, 0.3},
                                    matrank::SimulationOptions{}, 2);
  EXPECT_DOUBLE_EQ(selection.tau, 0.3);

  // 예측이 없으면 모든 후보의 점수가 0으로 같으므로 첫 후보가 남는다.
  std::vector<matrank::MatchBucket> empty_buckets(fixture.periods.size());
  auto idle = matrank::TuneTau(fixture.periods, empty_buckets, fixture.roster, {0.7, 0.2},
                               matrank::SimulationOptions{}, 2);
  EXPECT_DOUBLE_EQ(idle.tau, 0.7);
}

TEST(TauCalibrationTest, LogsEachCandidateAndCountsRuns) {
  const auto fixture = BuildFixture();
  std::ostringstream sink;
  auto observability = std::make_shared<matrank::Observability>(matrank::LogLevel::kDebug, sink);

  matrank::TuneTau(fixture.periods, fixture.buckets, fixture.roster, {0.1, 0.5}, matrank::SimulationOptions{}, 2,
                   observability);

  EXPECT_EQ(observability->Snapshot().runs_completed, 2u);
  EXPECT_NE(sink.str().find("tau_candidate"), std::string::npos);
}

TEST(TauCalibrationTest, RejectsEmptyCandidateList) {
  const auto fixture = BuildFixture();
  EXPECT_THROW(matrank::TuneTau(fixture.periods, fixture.buckets, fixture.roster, {}, matrank::SimulationOptions{}, 2),
               std::invalid_argument);
}

TEST(TauCalibrationTest, PropagatesInvalidCandidate) {
  const auto fixture = BuildFixture();
  EXPECT_THROW(
      matrank::TuneTau(fixture.periods, fixture.buckets, fixture.roster, {0.3, -1.0}, matrank::SimulationOptions{}, 2),
      std::invalid_argument);
}
