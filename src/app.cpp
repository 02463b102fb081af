/*
 * 설명: 레이팅 실행 파이프라인(기간 → 경기 → 보정 → 최종 실행 → 리더보드)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/match_store_it_test.cpp
 */
#include "matrank/app.hpp"

#include <chrono>
#include <fstream>

#include "matrank/leaderboard.hpp"
#include "matrank/overrides.hpp"
#include "matrank/rating_run.hpp"
#include "matrank/report.hpp"
#include "matrank/roster.hpp"

namespace matrank {
namespace {
long ElapsedMs(const std::chrono::steady_clock::time_point& started) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
}
}  // namespace

LeaderboardApp::LeaderboardApp(const AppConfig& config, std::ostream& out)
    : config_(config),
      out_(out),
      observability_(std::make_shared<Observability>(ParseLogLevel(config.log_level))),
      db_client_(std::make_shared<MariaDbClient>(
          DbConfig{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name})),
      match_store_(std::make_shared<MatchStore>(db_client_, observability_)) {}

std::vector<SeasonRecord> LeaderboardApp::LoadSeasons() const {
  std::ifstream in(config_.seasons_file);
  if (!in) {
    throw ConfigError("시즌 파일을 열 수 없음: " + config_.seasons_file);
  }
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded()) {
    throw ConfigError("시즌 파일 JSON 파싱 실패: " + config_.seasons_file);
  }
  auto seasons = ParseSeasons(doc);
  for (const auto& season : seasons) {
    if (!season.regular_start || !season.post_end) {
      observability_->AddSkipped();
      observability_->Log(LogLevel::kWarn, "season_skipped", {{"season", season.name}, {"reason", "시작/종료일 없음"}});
    }
  }
  return seasons;
}

void LeaderboardApp::Stop(const std::string& trace_id, const std::string& reason) const {
  observability_->Log(LogContext{trace_id, "run_stopped", LogLevel::kInfo, {{"reason", reason}}, 0});
}

void LeaderboardApp::Run() {
  const auto started = std::chrono::steady_clock::now();
  const std::string trace_id = observability_->NextTraceId();

  const auto seasons = LoadSeasons();
  if (seasons.empty()) {
    Stop(trace_id, "시즌 데이터 없음");
    return;
  }
  PeriodFilter filter{config_.seasons, config_.start_date, config_.end_date};
  const auto periods = BuildPeriods(seasons, filter, UtcNow());
  if (periods.empty()) {
    Stop(trace_id, "조건에 맞는 레이팅 기간 없음");
    return;
  }
  observability_->AddPeriods(periods.size());

  auto roster = match_store_->ActiveAthletes(config_.min_wins);
  if (roster.empty()) {
    Stop(trace_id, "활성 선수 없음. MIN_WINS를 낮춰 보세요");
    return;
  }
  const auto overrides = LoadOverrides(config_.overrides_file, observability_);
  for (const auto& athlete_id : overrides.ManualIds()) {
    if (overrides.exclude.count(athlete_id) == 0) {
      roster.insert(athlete_id);
    }
  }
  std::set<std::string> override_team_ids;
  for (const auto& entry : overrides.teams) {
    override_team_ids.insert(entry.second);
  }
  const auto override_team_meta = match_store_->FetchTeamInfo(override_team_ids);

  const std::vector<std::string> weight_classes = config_.weight_classes.value_or(kDefaultWeightClasses);
  std::optional<std::set<std::string>> weight_filter;
  if (config_.weight_classes) {
    weight_filter = std::set<std::string>(config_.weight_classes->begin(), config_.weight_classes->end());
  }

  auto matches = match_store_->MatchesBetween(periods.front().start, periods.back().end, roster, weight_filter);
  if (matches.empty()) {
    Stop(trace_id, "조건에 맞는 경기 없음");
    return;
  }
  const std::size_t match_count = matches.size();
  const auto records = TallyRecords(matches);
  observability_->Log(LogContext{trace_id,
                                 "matches_loaded",
                                 LogLevel::kInfo,
                                 {{"matches", match_count}, {"periods", periods.size()}, {"roster", roster.size()}},
                                 ElapsedMs(started)});

  const auto buckets = BucketMatches(periods, std::move(matches));

  SimulationOptions options;
  if (config_.tau) {
    options.engine.tau = *config_.tau;
    observability_->Log(LogContext{trace_id, "tau_provided", LogLevel::kInfo, {{"tau", *config_.tau}}, 0});
  } else {
    const auto selection = TuneTau(periods, buckets, roster, config_.tau_candidates, options,
                                   config_.calibration_threads, observability_);
    options.engine.tau = selection.tau;
    observability_->Log(LogContext{trace_id,
                                   "tau_tuned",
                                   LogLevel::kInfo,
                                   {{"tau", selection.tau},
                                    {"brier", selection.score.brier},
                                    {"accuracy", selection.score.accuracy},
                                    {"candidates", config_.tau_candidates.size()}},
                                   ElapsedMs(started)});
  }

  const auto result = RunSimulation(periods, buckets, roster, options);
  observability_->IncrementRuns();

  std::set<std::string> rated_ids;
  for (const auto& entry : result.ratings) {
    rated_ids.insert(entry.first);
  }
  const auto info = match_store_->FetchAthleteInfo(rated_ids);
  const auto eligible =
      SelectEligibleAthletes(rated_ids, info, overrides, config_.grad_year, SchoolYear(UtcNow()));
  if (eligible.empty()) {
    Stop(trace_id, "졸업연도 필터로 모든 선수가 제외됨");
    return;
  }
  const auto context = BuildRosterContext(info, eligible, overrides, override_team_meta);

  LeaderboardRequest request;
  request.weight_classes = weight_classes;
  request.limit = config_.limit;
  request.allowed_ids = eligible;
  request.profiles = context.profiles;
  request.weight_overrides = overrides.weights;
  request.records = records;
  const auto leaderboard = BuildLeaderboard(result, request);
  const auto teams = BuildTeamRosters(leaderboard, weight_classes, context.teams);

  const ReportSummary summary{options.engine.tau, match_count, periods.size(), config_.grad_year};
  if (config_.json_out) {
    WriteReportFile(*config_.json_out, BuildReportPayload(summary, overrides, context, leaderboard, teams));
  } else {
    WriteTextReport(out_, summary, leaderboard);
  }

  const auto metrics = observability_->Snapshot();
  nlohmann::json fields{{"athletes", leaderboard.athletes.size()},
                        {"teams", teams.size()},
                        {"recordsSkipped", metrics.records_skipped},
                        {"matchesProcessed", metrics.matches_processed},
                        {"periodsProcessed", metrics.periods_processed},
                        {"runsCompleted", metrics.runs_completed}};
  if (config_.json_out) {
    fields["jsonOut"] = *config_.json_out;
  }
  observability_->Log(LogContext{trace_id, "run_completed", LogLevel::kInfo, fields, ElapsedMs(started)});
}

}  // namespace matrank
