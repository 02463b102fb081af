/*
 * 설명: 구조화 로그와 실행 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/observability_test.cpp
 */
#include "matrank/observability.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace matrank {

LogLevel ParseLogLevel(const std::string& text) {
  std::string key = text;
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
  if (key == "debug") {
    return LogLevel::kDebug;
  }
  if (key == "warn" || key == "warning") {
    return LogLevel::kWarn;
  }
  if (key == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream& sink) : min_level_(min_level), sink_(sink) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::AddSkipped(std::uint64_t count) { records_skipped_.fetch_add(count); }

void Observability::AddMatches(std::uint64_t count) { matches_processed_.fetch_add(count); }

void Observability::AddPeriods(std::uint64_t count) { periods_processed_.fetch_add(count); }

void Observability::IncrementRuns() { runs_completed_.fetch_add(1); }

RunMetrics Observability::Snapshot() const {
  RunMetrics snapshot;
  snapshot.records_skipped = records_skipped_.load();
  snapshot.matches_processed = matches_processed_.load();
  snapshot.periods_processed = periods_processed_.load();
  snapshot.runs_completed = runs_completed_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["level"] = ToString(ctx.level);
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.fields.is_object() && !ctx.fields.empty()) {
    log_json["fields"] = ctx.fields;
  }
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ << log_json.dump() << std::endl;
}

void Observability::Log(LogLevel level, const std::string& name, nlohmann::json fields) const {
  LogContext ctx;
  ctx.name = name;
  ctx.level = level;
  ctx.fields = std::move(fields);
  Log(ctx);
}

}  // namespace matrank
