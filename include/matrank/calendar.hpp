/*
 * 설명: UTC 타임스탬프 파싱과 월 단위 달력 연산을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/rating_period_test.cpp, tests/unit/roster_test.cpp
 */
#pragma once

#include <optional>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace matrank {

using Timestamp = boost::posix_time::ptime;

// "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.ffffff][Z|+hh:mm]" 형식을 UTC로 해석한다.
std::optional<Timestamp> ParseTimestamp(const std::string& text);
std::string ToIsoString(const Timestamp& ts);
Timestamp UtcNow();

// anchor의 일(day)을 유지한 채 months개월 뒤로 이동한다. 해당 월에 그 날짜가 없으면 말일로 맞춘다.
Timestamp AddCalendarMonths(const Timestamp& anchor, int months);

// 두 시각 사이의 간격을 30일 단위 개월 수로 근사한다. second <= first 이면 0.
double MonthsBetween(const Timestamp& first, const Timestamp& second);

// 9월부터 새 학년도가 시작된다.
int SchoolYear(const Timestamp& ts);

}  // namespace matrank
