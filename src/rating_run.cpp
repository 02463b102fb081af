/*
 * 설명: 레이팅 시뮬레이션 실행과 tau 보정 탐색을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/rating_run_test.cpp
 */
#include "matrank/rating_run.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <limits>
#include <optional>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace matrank {

std::vector<double> DefaultTauCandidates() { return {0.1, 0.2, 0.3, 0.4, 0.5, 0.7}; }

RatingRunResult RunSimulation(const std::vector<RatingPeriod>& periods, const std::vector<MatchBucket>& buckets,
                              const std::set<std::string>& roster, const SimulationOptions& options) {
  Glicko2Engine engine(options.engine);
  for (const auto& athlete_id : roster) {
    engine.EnsurePlayer(athlete_id);
  }

  RatingRunResult result;
  std::optional<Timestamp> prev_end;
  std::optional<std::string> prev_season;
  const std::size_t count = std::min(periods.size(), buckets.size());
  for (std::size_t i = 0; i < count; ++i) {
    const auto& period = periods[i];
    if (prev_end) {
      engine.InflateForGap(MonthsBetween(*prev_end, period.start));
    }
    if (options.reset_rd_on_new_season && (!prev_season || *prev_season != period.season)) {
      engine.ResetRdForSeason();
      prev_season = period.season;
    }
    auto predictions = engine.ProcessPeriod(buckets[i], result.head_to_head, result.weight_usage);
    result.predictions.insert(result.predictions.end(), predictions.begin(), predictions.end());
    prev_end = period.end;
  }

  result.ratings = engine.TakeStates();
  return result;
}

PredictionScore EvaluatePredictions(const std::vector<Prediction>& predictions) {
  if (predictions.empty()) {
    return PredictionScore{};
  }
  double squared_error = 0.0;
  std::size_t correct = 0;
  for (const auto& prediction : predictions) {
    const double diff = prediction.probability - prediction.actual;
    squared_error += diff * diff;
    if ((prediction.probability >= 0.5 && prediction.actual == 1.0) ||
        (prediction.probability < 0.5 && prediction.actual == 0.0)) {
      ++correct;
    }
  }
  const double n = static_cast<double>(predictions.size());
  return PredictionScore{squared_error / n, static_cast<double>(correct) / n};
}

TauSelection TuneTau(const std::vector<RatingPeriod>& periods, const std::vector<MatchBucket>& buckets,
                     const std::set<std::string>& roster, const std::vector<double>& candidates,
                     const SimulationOptions& base_options, std::size_t threads,
                     const std::shared_ptr<Observability>& observability) {
  if (candidates.empty()) {
    throw std::invalid_argument("tau 후보가 비어 있음");
  }

  std::vector<std::promise<PredictionScore>> promises(candidates.size());
  std::vector<std::future<PredictionScore>> futures;
  futures.reserve(candidates.size());
  for (auto& promise : promises) {
    futures.push_back(promise.get_future());
  }

  boost::asio::thread_pool pool(std::max<std::size_t>(1, std::min(threads, candidates.size())));
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    boost::asio::post(pool, [&, i]() {
      try {
        SimulationOptions options = base_options;
        options.engine.tau = candidates[i];
        auto run = RunSimulation(periods, buckets, roster, options);
        promises[i].set_value(EvaluatePredictions(run.predictions));
      } catch (...) {
        promises[i].set_exception(std::current_exception());
      }
    });
  }
  pool.join();

  TauSelection best{candidates.front(), PredictionScore{std::numeric_limits<double>::infinity(), 0.0}};
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    // 실패한 실행의 예외는 여기서 다시 던져진다.
    const PredictionScore score = futures[i].get();
    if (observability) {
      observability->IncrementRuns();
      observability->Log(LogLevel::kDebug, "tau_candidate",
                         {{"tau", candidates[i]}, {"brier", score.brier}, {"accuracy", score.accuracy}});
    }
    if (score.brier < best.score.brier) {
      best = TauSelection{candidates[i], score};
    }
  }
  return best;
}

}  // namespace matrank
