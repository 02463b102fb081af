/*
 * 설명: Glicko-2 기간 업데이트, 불확실성 증가, 변동성 근 찾기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/glicko2_test.cpp, tests/unit/rating_run_test.cpp
 */
#include "matrank/glicko2.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace matrank {
namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kConvergenceTolerance = 1e-6;
constexpr std::size_t kMaxBracketSteps = 10000;
constexpr std::size_t kMaxSolverIterations = 1000;

std::string DescribeSolverInput(double delta, double phi_star, double v, double tau, double sigma) {
  std::ostringstream oss;
  oss << "delta=" << delta << " phi*=" << phi_star << " v=" << v << " tau=" << tau << " sigma=" << sigma;
  return oss.str();
}
}  // namespace

void WeightClassWindow::Record(const std::string& weight_class, std::size_t limit) {
  if (weight_class.empty()) {
    return;
  }
  history_.push_back(weight_class);
  auto it = std::find_if(counts_.begin(), counts_.end(),
                         [&](const std::pair<std::string, int>& entry) { return entry.first == weight_class; });
  if (it == counts_.end()) {
    counts_.emplace_back(weight_class, 1);
  } else {
    ++it->second;
  }

  while (history_.size() > std::max<std::size_t>(1, limit)) {
    const std::string removed = history_.front();
    history_.pop_front();
    auto removed_it = std::find_if(counts_.begin(), counts_.end(),
                                   [&](const std::pair<std::string, int>& entry) { return entry.first == removed; });
    if (removed_it != counts_.end() && --removed_it->second <= 0) {
      counts_.erase(removed_it);
    }
  }
}

std::optional<std::string> WeightClassWindow::Primary() const {
  const std::pair<std::string, int>* best = nullptr;
  for (const auto& entry : counts_) {
    if (!best || entry.second > best->second) {
      best = &entry;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  return best->first;
}

int WeightClassWindow::Count(const std::string& weight_class) const {
  for (const auto& entry : counts_) {
    if (entry.first == weight_class) {
      return entry.second;
    }
  }
  return 0;
}

double GlickoG(double phi) { return 1.0 / std::sqrt(1.0 + 3.0 * phi * phi / (kPi * kPi)); }

double ExpectedScore(double mu, double mu_j, double phi_j) {
  return 1.0 / (1.0 + std::exp(-GlickoG(phi_j) * (mu - mu_j)));
}

double WinProbability(const AthleteRating& player, const AthleteRating& opponent) {
  const double mu = (player.rating - kDefaultRating) / kGlickoScale;
  const double mu_j = (opponent.rating - kDefaultRating) / kGlickoScale;
  const double phi_j = opponent.rd / kGlickoScale;
  return ExpectedScore(mu, mu_j, phi_j);
}

double SolveVolatility(double delta, double phi_star, double v, double tau, double sigma) {
  if (!(tau > 0.0) || !(sigma > 0.0) || !(v > 0.0)) {
    throw std::invalid_argument("변동성 계산 입력이 올바르지 않음: " + DescribeSolverInput(delta, phi_star, v, tau, sigma));
  }

  const double a = std::log(sigma * sigma);
  const double phi2 = phi_star * phi_star;
  const double delta2 = delta * delta;
  const double tau2 = tau * tau;
  auto f = [&](double x) {
    const double ex = std::exp(x);
    const double denom = phi2 + v + ex;
    return ex * (delta2 - phi2 - v - ex) / (2.0 * denom * denom) - (x - a) / tau2;
  };

  double A = a;
  double B = 0.0;
  if (delta2 > phi2 + v) {
    B = std::log(delta2 - phi2 - v);
  } else {
    std::size_t k = 1;
    while (f(a - static_cast<double>(k) * tau) < 0.0) {
      if (++k > kMaxBracketSteps) {
        throw RatingConvergenceError("변동성 구간 확장 실패: " + DescribeSolverInput(delta, phi_star, v, tau, sigma));
      }
    }
    B = a - static_cast<double>(k) * tau;
  }

  double fA = f(A);
  double fB = f(B);
  std::size_t iterations = 0;
  while (std::abs(B - A) > kConvergenceTolerance) {
    if (++iterations > kMaxSolverIterations) {
      throw RatingConvergenceError("변동성 수렴 실패: " + DescribeSolverInput(delta, phi_star, v, tau, sigma));
    }
    const double C = A + (A - B) * fA / (fB - fA);
    const double fC = f(C);
    if (!std::isfinite(C) || !std::isfinite(fC)) {
      throw RatingConvergenceError("변동성 계산 중 비유한 값: " + DescribeSolverInput(delta, phi_star, v, tau, sigma));
    }
    if (fC * fB < 0.0) {
      A = B;
      fA = fB;
    } else {
      fA = fA / 2.0;
    }
    B = C;
    fB = fC;
  }
  return std::exp(A / 2.0);
}

Glicko2Engine::Glicko2Engine(const Glicko2Options& options) : options_(options) {
  if (!(options_.tau > 0.0)) {
    throw std::invalid_argument("tau는 양수여야 함");
  }
  if (!(options_.min_rd > 0.0) || options_.min_rd > options_.max_rd) {
    throw std::invalid_argument("RD 범위가 올바르지 않음");
  }
  options_.weight_history_limit = std::max<std::size_t>(1, options_.weight_history_limit);
}

void Glicko2Engine::EnsurePlayer(const std::string& athlete_id) {
  if (states_.count(athlete_id) == 0) {
    states_[athlete_id] = AthleteRating{};
  }
}

double Glicko2Engine::WinProbability(const std::string& athlete_id, const std::string& opponent_id) const {
  return matrank::WinProbability(StateOf(athlete_id), StateOf(opponent_id));
}

void Glicko2Engine::InflateForGap(double months) {
  if (!(months > 0.0)) {
    return;
  }
  for (auto& entry : states_) {
    auto& state = entry.second;
    double phi = state.rd / kGlickoScale;
    phi = std::sqrt(phi * phi + months * state.sigma * state.sigma);
    state.rd = ClampRd(phi * kGlickoScale);
  }
}

void Glicko2Engine::ResetRdForSeason() {
  const double floor = std::max(options_.min_rd, std::min(options_.max_rd, options_.season_rd_floor));
  for (auto& entry : states_) {
    entry.second.rd = std::min(options_.max_rd, std::max(entry.second.rd, floor));
  }
}

std::vector<Prediction> Glicko2Engine::ProcessPeriod(const std::vector<MatchResult>& matches, HeadToHead& head_to_head,
                                                     WeightUsage& weight_usage) {
  std::map<std::string, std::vector<GameOutcome>> results_by_player;
  std::vector<Prediction> predictions;

  for (const auto& match : matches) {
    if (!match.IsRated()) {
      continue;
    }
    EnsurePlayer(match.top_id);
    EnsurePlayer(match.bottom_id);

    if (match.weight_class) {
      weight_usage[match.top_id].Record(*match.weight_class, options_.weight_history_limit);
      weight_usage[match.bottom_id].Record(*match.weight_class, options_.weight_history_limit);
    }

    // 기간 중에는 상태를 바꾸지 않으므로 기간 시작 시점의 상대 상태를 읽는다.
    const AthleteRating top_state = states_.at(match.top_id);
    const AthleteRating bottom_state = states_.at(match.bottom_id);
    const double prob_top = matrank::WinProbability(top_state, bottom_state);
    const double actual_top = match.TopWon() ? 1.0 : 0.0;
    predictions.push_back(Prediction{prob_top, actual_top});

    const double weight = WinTypeWeight(ParseWinType(match.win_type));
    results_by_player[match.top_id].push_back(GameOutcome{bottom_state, actual_top, weight});
    results_by_player[match.bottom_id].push_back(GameOutcome{top_state, 1.0 - actual_top, weight});

    ++head_to_head[{*match.winner_id, match.LoserId()}];
  }

  std::vector<std::pair<std::string, AthleteRating>> updated;
  updated.reserve(results_by_player.size());
  for (const auto& entry : results_by_player) {
    updated.emplace_back(entry.first, UpdateAthlete(states_.at(entry.first), entry.second));
  }
  for (auto& entry : updated) {
    states_[entry.first] = entry.second;
  }
  return predictions;
}

AthleteRating Glicko2Engine::UpdateAthlete(const AthleteRating& player, const std::vector<GameOutcome>& results) const {
  const double mu = (player.rating - kDefaultRating) / kGlickoScale;
  const double phi = player.rd / kGlickoScale;
  const double phi_star = std::sqrt(phi * phi + player.sigma * player.sigma);
  const AthleteRating idle{player.rating, ClampRd(phi_star * kGlickoScale), player.sigma};
  if (results.empty()) {
    return idle;
  }

  double v_inv = 0.0;
  double delta_sum = 0.0;
  for (const auto& result : results) {
    const double mu_j = (result.opponent.rating - kDefaultRating) / kGlickoScale;
    const double phi_j = result.opponent.rd / kGlickoScale;
    const double g_phi = GlickoG(phi_j);
    const double expected = ExpectedScore(mu, mu_j, phi_j);
    v_inv += result.weight * g_phi * g_phi * expected * (1.0 - expected);
    delta_sum += result.weight * g_phi * (result.score - expected);
  }
  // 가중치가 모두 0이면 유효한 갱신이 없다.
  if (!(v_inv > 0.0)) {
    return idle;
  }

  const double v = 1.0 / v_inv;
  const double delta = v * delta_sum;
  const double sigma_prime = SolveVolatility(delta, phi_star, v, options_.tau, player.sigma);
  const double phi_prime = 1.0 / std::sqrt(1.0 / (phi_star * phi_star + sigma_prime * sigma_prime) + 1.0 / v);
  const double mu_prime = mu + phi_prime * phi_prime * delta_sum;

  AthleteRating next{kDefaultRating + mu_prime * kGlickoScale, ClampRd(phi_prime * kGlickoScale), sigma_prime};
  if (!std::isfinite(next.rating) || !std::isfinite(next.rd) || !std::isfinite(next.sigma)) {
    throw RatingConvergenceError("레이팅 갱신 결과가 유한하지 않음");
  }
  return next;
}

double Glicko2Engine::ClampRd(double rd) const { return std::min(options_.max_rd, std::max(options_.min_rd, rd)); }

AthleteRating Glicko2Engine::StateOf(const std::string& athlete_id) const {
  auto it = states_.find(athlete_id);
  return it == states_.end() ? AthleteRating{} : it->second;
}

}  // namespace matrank
