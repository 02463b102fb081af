/*
 * 설명: 기간 순서대로 전체 시뮬레이션을 실행하고 tau 후보를 백테스트로 선택한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/rating_run_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "matrank/glicko2.hpp"
#include "matrank/observability.hpp"
#include "matrank/rating_period.hpp"

namespace matrank {

struct RatingRunResult {
  std::unordered_map<std::string, AthleteRating> ratings;
  HeadToHead head_to_head;
  WeightUsage weight_usage;
  std::vector<Prediction> predictions;
};

struct SimulationOptions {
  Glicko2Options engine;
  bool reset_rd_on_new_season{true};
};

struct PredictionScore {
  double brier{0.0};
  double accuracy{0.0};
};

struct TauSelection {
  double tau;
  PredictionScore score;
};

std::vector<double> DefaultTauCandidates();

// 실행마다 새 엔진을 만든다. 기간 사이 공백만큼 RD를 키우고 시즌이 바뀌면 RD 하한을 적용한다.
RatingRunResult RunSimulation(const std::vector<RatingPeriod>& periods, const std::vector<MatchBucket>& buckets,
                              const std::set<std::string>& roster, const SimulationOptions& options);

PredictionScore EvaluatePredictions(const std::vector<Prediction>& predictions);

// Brier 점수가 가장 낮은 후보를 고른다. 동률이면 목록에서 먼저 나온 후보가 유지된다.
// 후보별 실행은 상태를 공유하지 않으므로 스레드 풀에서 병렬로 돌린다.
TauSelection TuneTau(const std::vector<RatingPeriod>& periods, const std::vector<MatchBucket>& buckets,
                     const std::set<std::string>& roster, const std::vector<double>& candidates,
                     const SimulationOptions& base_options, std::size_t threads,
                     const std::shared_ptr<Observability>& observability = nullptr);

}  // namespace matrank
