/*
 * 설명: 기간 단위 Glicko-2 레이팅 엔진과 변동성 근 찾기를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/glicko2_test.cpp, tests/unit/rating_run_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "matrank/match.hpp"

namespace matrank {

constexpr double kGlickoScale = 173.7178;
constexpr double kDefaultRating = 1500.0;
constexpr double kDefaultRd = 350.0;
constexpr double kDefaultSigma = 0.06;
constexpr double kMinRd = 30.0;
constexpr double kMaxRd = 350.0;
constexpr double kSeasonRdFloor = 150.0;
constexpr std::size_t kRecentWeightMatches = 5;

class RatingConvergenceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct AthleteRating {
  double rating{kDefaultRating};
  double rd{kDefaultRd};
  double sigma{kDefaultSigma};
};

struct GameOutcome {
  AthleteRating opponent;
  double score;
  double weight;
};

struct Prediction {
  double probability;
  double actual;
};

// 최근 N개 체급의 슬라이딩 윈도우. 카운트 목록은 체급이 처음 추가된 순서를 유지하고,
// 카운트가 0이 되어 빠진 체급만 다시 추가될 때 뒤로 간다.
class WeightClassWindow {
 public:
  void Record(const std::string& weight_class, std::size_t limit);
  // 최빈 체급. 동률이면 카운트 목록에서 앞선 체급을 고른다. 윈도우 안의 첫 등장 순서와 다를 수 있다.
  std::optional<std::string> Primary() const;
  const std::deque<std::string>& History() const { return history_; }
  int Count(const std::string& weight_class) const;

 private:
  std::deque<std::string> history_;
  std::vector<std::pair<std::string, int>> counts_;
};

using HeadToHead = std::map<std::pair<std::string, std::string>, int>;
using WeightUsage = std::unordered_map<std::string, WeightClassWindow>;

struct Glicko2Options {
  double tau{0.5};
  double min_rd{kMinRd};
  double max_rd{kMaxRd};
  double season_rd_floor{kSeasonRdFloor};
  std::size_t weight_history_limit{kRecentWeightMatches};
};

double GlickoG(double phi);
double ExpectedScore(double mu, double mu_j, double phi_j);
double WinProbability(const AthleteRating& player, const AthleteRating& opponent);

// Illinois 변형 가위치법으로 새 변동성 sigma'를 구한다. 엔진 상태와 무관한 순수 함수.
double SolveVolatility(double delta, double phi_star, double v, double tau, double sigma);

class Glicko2Engine {
 public:
  explicit Glicko2Engine(const Glicko2Options& options);

  void EnsurePlayer(const std::string& athlete_id);
  double WinProbability(const std::string& athlete_id, const std::string& opponent_id) const;
  void InflateForGap(double months);
  void ResetRdForSeason();
  std::vector<Prediction> ProcessPeriod(const std::vector<MatchResult>& matches, HeadToHead& head_to_head,
                                        WeightUsage& weight_usage);

  AthleteRating UpdateAthlete(const AthleteRating& player, const std::vector<GameOutcome>& results) const;

  const std::unordered_map<std::string, AthleteRating>& States() const { return states_; }
  std::unordered_map<std::string, AthleteRating> TakeStates() { return std::move(states_); }
  const Glicko2Options& Options() const { return options_; }

 private:
  double ClampRd(double rd) const;
  AthleteRating StateOf(const std::string& athlete_id) const;

  Glicko2Options options_;
  std::unordered_map<std::string, AthleteRating> states_;
};

}  // namespace matrank
