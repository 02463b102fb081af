/*
 * 설명: 구조화 로그와 실행 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace matrank {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 값은 info로 처리한다.
LogLevel ParseLogLevel(const std::string& text);
const char* ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  nlohmann::json fields;
  long latency_ms{0};
};

struct RunMetrics {
  std::uint64_t records_skipped{0};
  std::uint64_t matches_processed{0};
  std::uint64_t periods_processed{0};
  std::uint64_t runs_completed{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream& sink = std::cout);

  std::string NextTraceId();
  void AddSkipped(std::uint64_t count = 1);
  void AddMatches(std::uint64_t count);
  void AddPeriods(std::uint64_t count);
  void IncrementRuns();
  RunMetrics Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void Log(LogLevel level, const std::string& name, nlohmann::json fields = nlohmann::json::object()) const;

 private:
  LogLevel min_level_;
  std::ostream& sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> records_skipped_{0};
  std::atomic<std::uint64_t> matches_processed_{0};
  std::atomic<std::uint64_t> periods_processed_{0};
  std::atomic<std::uint64_t> runs_completed_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace matrank
