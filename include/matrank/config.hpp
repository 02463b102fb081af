/*
 * 설명: 리더보드 실행 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "matrank/calendar.hpp"

namespace matrank {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct AppConfig {
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string seasons_file;
  std::optional<std::set<std::string>> seasons;
  std::optional<Timestamp> start_date;
  std::optional<Timestamp> end_date;  // END_DATE 다음 날 0시 (미포함)
  std::optional<std::vector<std::string>> weight_classes;  // 없으면 기본 체급 전체
  std::optional<std::size_t> limit;
  int min_wins;
  std::optional<double> tau;
  std::vector<double> tau_candidates;
  std::optional<int> grad_year;
  std::optional<std::string> overrides_file;
  std::optional<std::string> json_out;
  std::size_t calibration_threads;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// 쉼표로 나눈 뒤 앞뒤 공백을 지우고 빈 항목은 버린다.
std::vector<std::string> SplitList(const std::string& text);

AppConfig LoadConfig(const EnvLookup& lookup);
AppConfig LoadConfigFromEnv();

}  // namespace matrank
