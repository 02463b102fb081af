/*
 * 설명: 환경 변수에서 실행 설정을 읽고 형식을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_test.cpp
 */
#include "matrank/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <thread>

#include "matrank/rating_run.hpp"

namespace matrank {
namespace {
std::string Trim(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string{};
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::optional<std::string> NonEmpty(const EnvLookup& lookup, const std::string& key) {
  auto value = lookup(key);
  if (!value) {
    return std::nullopt;
  }
  auto trimmed = Trim(*value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

long ParseInteger(const std::string& key, const std::string& text) {
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0') {
    throw ConfigError(key + " 값이 정수가 아님: " + text);
  }
  return value;
}

double ParseDouble(const std::string& key, const std::string& text) {
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    throw ConfigError(key + " 값이 실수가 아님: " + text);
  }
  return value;
}

Timestamp ParseDate(const std::string& key, const std::string& text) {
  auto parsed = ParseTimestamp(text);
  if (!parsed) {
    throw ConfigError(key + " 날짜 형식 오류(YYYY-MM-DD): " + text);
  }
  return *parsed;
}
}  // namespace

std::vector<std::string> SplitList(const std::string& text) {
  std::vector<std::string> items;
  std::size_t begin = 0;
  while (begin <= text.size()) {
    std::size_t end = text.find(',', begin);
    if (end == std::string::npos) {
      end = text.size();
    }
    auto item = Trim(text.substr(begin, end - begin));
    if (!item.empty()) {
      items.push_back(std::move(item));
    }
    begin = end + 1;
  }
  return items;
}

AppConfig LoadConfig(const EnvLookup& lookup) {
  auto get_env = [&](const char* key, const char* def) -> std::string {
    auto value = NonEmpty(lookup, key);
    return value ? *value : std::string{def};
  };

  AppConfig cfg;
  cfg.db_host = get_env("DB_HOST", "mariadb");
  const long db_port = ParseInteger("DB_PORT", get_env("DB_PORT", "3306"));
  if (db_port <= 0 || db_port > 65535) {
    throw ConfigError("DB_PORT 범위 오류: " + std::to_string(db_port));
  }
  cfg.db_port = static_cast<unsigned short>(db_port);
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.seasons_file = get_env("SEASONS_FILE", "seasons.json");

  if (auto seasons = NonEmpty(lookup, "SEASONS")) {
    auto names = SplitList(*seasons);
    cfg.seasons = std::set<std::string>(names.begin(), names.end());
  }
  if (auto start = NonEmpty(lookup, "START_DATE")) {
    cfg.start_date = ParseDate("START_DATE", *start);
  }
  if (auto end = NonEmpty(lookup, "END_DATE")) {
    cfg.end_date = ParseDate("END_DATE", *end) + boost::gregorian::days(1);
  }

  if (auto weights = NonEmpty(lookup, "WEIGHTS")) {
    auto classes = SplitList(*weights);
    if (!(classes.size() == 1 && Lower(classes.front()) == "all") && !classes.empty()) {
      cfg.weight_classes = std::move(classes);
    }
  }
  if (auto limit = NonEmpty(lookup, "LIMIT")) {
    const long value = ParseInteger("LIMIT", *limit);
    if (value < 0) {
      throw ConfigError("LIMIT 값은 0 이상이어야 함: " + *limit);
    }
    cfg.limit = static_cast<std::size_t>(value);
  }
  cfg.min_wins = static_cast<int>(ParseInteger("MIN_WINS", get_env("MIN_WINS", "1")));

  if (auto tau = NonEmpty(lookup, "TAU")) {
    cfg.tau = ParseDouble("TAU", *tau);
  }
  cfg.tau_candidates = DefaultTauCandidates();
  if (auto candidates = NonEmpty(lookup, "TAU_CANDIDATES")) {
    std::vector<double> parsed;
    for (const auto& item : SplitList(*candidates)) {
      parsed.push_back(ParseDouble("TAU_CANDIDATES", item));
    }
    if (!parsed.empty()) {
      cfg.tau_candidates = std::move(parsed);
    }
  }

  if (auto grad_year = NonEmpty(lookup, "GRAD_YEAR")) {
    cfg.grad_year = static_cast<int>(ParseInteger("GRAD_YEAR", *grad_year));
  }
  cfg.overrides_file = NonEmpty(lookup, "OVERRIDES_FILE");
  cfg.json_out = NonEmpty(lookup, "JSON_OUT");

  const std::size_t hardware = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  const long threads = ParseInteger("CALIBRATION_THREADS", get_env("CALIBRATION_THREADS",
                                                                   std::to_string(hardware).c_str()));
  if (threads <= 0) {
    throw ConfigError("CALIBRATION_THREADS 값은 1 이상이어야 함");
  }
  cfg.calibration_threads = static_cast<std::size_t>(threads);
  return cfg;
}

AppConfig LoadConfigFromEnv() {
  return LoadConfig([](const std::string& key) -> std::optional<std::string> {
    const char* val = std::getenv(key.c_str());
    return val ? std::optional<std::string>(val) : std::nullopt;
  });
}

}  // namespace matrank
