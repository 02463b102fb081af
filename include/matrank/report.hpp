/*
 * 설명: 리더보드 결과를 JSON 페이로드와 텍스트 표로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/report_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "matrank/leaderboard.hpp"
#include "matrank/overrides.hpp"
#include "matrank/roster.hpp"

namespace matrank {

struct ReportSummary {
  double tau;
  std::size_t matches;
  std::size_t periods;
  std::optional<int> grad_year;
};

nlohmann::json BuildReportPayload(const ReportSummary& summary, const AthleteOverrides& overrides,
                                  const RosterContext& roster, const Leaderboard& leaderboard,
                                  const std::vector<TeamRoster>& teams);

void WriteReportFile(const std::string& path, const nlohmann::json& payload);

void WriteTextReport(std::ostream& out, const ReportSummary& summary, const Leaderboard& leaderboard);

}  // namespace matrank
